#pragma once

#include "regtoken/core/constants.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace regtoken::configuration {

/// Configuration for the registration token codec
///
/// The wire parameters (iteration count, key and salt sizes, splice position range)
/// are fixed: every producer and consumer of a token must agree on them, so they are
/// exposed read-only. The tunable values only affect how a consumer treats tokens:
///
/// - validity window: advisory lifetime measured from `generatedAtUtc`
/// - clock skew tolerance: how far in the future a timestamp may lie before the
///   token is treated as not yet valid
/// - max token length: upper bound the parser accepts before doing any work
///
/// @example
/// ```cpp
/// auto config = CodecConfig::Default().WithValidityWindow(std::chrono::minutes{5});
/// if (config.Validate().IsErr()) { ... }
/// ```
class CodecConfig {
public:
    [[nodiscard]] static constexpr CodecConfig Default() noexcept {
        return CodecConfig(
            TokenConstants::DEFAULT_VALIDITY_WINDOW,
            TokenConstants::DEFAULT_CLOCK_SKEW_TOLERANCE,
            TokenConstants::DEFAULT_MAX_TOKEN_LENGTH);
    }

    [[nodiscard]] constexpr CodecConfig WithValidityWindow(
        const std::chrono::seconds window) const noexcept {
        return CodecConfig(window, clock_skew_tolerance_, max_token_length_);
    }

    [[nodiscard]] constexpr CodecConfig WithClockSkewTolerance(
        const std::chrono::seconds tolerance) const noexcept {
        return CodecConfig(validity_window_, tolerance, max_token_length_);
    }

    [[nodiscard]] constexpr CodecConfig WithMaxTokenLength(const size_t length) const noexcept {
        return CodecConfig(validity_window_, clock_skew_tolerance_, length);
    }

    // =========================================================================
    // Wire parameters
    // =========================================================================

    [[nodiscard]] static constexpr uint32_t Pbkdf2Iterations() noexcept {
        return Constants::PBKDF2_ITERATIONS;
    }
    [[nodiscard]] static constexpr uint8_t MinSplicePosition() noexcept {
        return TokenConstants::MIN_SPLICE_POSITION;
    }
    [[nodiscard]] static constexpr uint8_t MaxSplicePosition() noexcept {
        return TokenConstants::MAX_SPLICE_POSITION;
    }
    [[nodiscard]] static constexpr size_t MinTokenLength() noexcept {
        return TokenConstants::MIN_TOKEN_LENGTH;
    }

    // =========================================================================
    // Consumer policy
    // =========================================================================

    [[nodiscard]] constexpr std::chrono::seconds ValidityWindow() const noexcept {
        return validity_window_;
    }
    [[nodiscard]] constexpr std::chrono::seconds ClockSkewTolerance() const noexcept {
        return clock_skew_tolerance_;
    }
    [[nodiscard]] constexpr size_t MaxTokenLength() const noexcept {
        return max_token_length_;
    }

    [[nodiscard]] Result<Unit, TokenFailure> Validate() const {
        if (validity_window_ <= std::chrono::seconds::zero()) {
            return Result<Unit, TokenFailure>::Err(
                TokenFailure::InvalidInput("Validity window must be positive"));
        }
        if (clock_skew_tolerance_ < std::chrono::seconds::zero()) {
            return Result<Unit, TokenFailure>::Err(
                TokenFailure::InvalidInput("Clock skew tolerance cannot be negative"));
        }
        if (max_token_length_ < MinTokenLength()) {
            return Result<Unit, TokenFailure>::Err(
                TokenFailure::InvalidInput("Maximum token length is below the minimum token length"));
        }
        return Result<Unit, TokenFailure>::Ok(unit);
    }

    constexpr bool operator==(const CodecConfig&) const noexcept = default;

private:
    constexpr CodecConfig(
        const std::chrono::seconds validity_window,
        const std::chrono::seconds clock_skew_tolerance,
        const size_t max_token_length) noexcept
        : validity_window_(validity_window)
        , clock_skew_tolerance_(clock_skew_tolerance)
        , max_token_length_(max_token_length) {}

    std::chrono::seconds validity_window_;
    std::chrono::seconds clock_skew_tolerance_;
    size_t max_token_length_;
};

} // namespace regtoken::configuration
