#pragma once

#include <fmt/core.h>

namespace regtoken::compat {
    using fmt::format;
}
