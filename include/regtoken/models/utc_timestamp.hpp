#pragma once

#include "regtoken/core/option.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace regtoken::models {

using UtcSeconds = std::chrono::sys_seconds;

/// Parse `YYYY-MM-DDTHH:MM:SSZ`. Anything else, including fractional seconds,
/// offsets other than `Z` and out-of-range calendar fields, yields None.
[[nodiscard]] Option<UtcSeconds> ParseUtcTimestamp(std::string_view text);

/// Format as `YYYY-MM-DDTHH:MM:SSZ`.
[[nodiscard]] std::string FormatUtcTimestamp(UtcSeconds instant);

} // namespace regtoken::models
