#pragma once

#include "regtoken/configuration/codec_config.hpp"
#include "regtoken/models/credential_bundle.hpp"

#include <chrono>
#include <string_view>

namespace regtoken::policy {

enum class TokenFreshness {
    Fresh,
    Expired,
    NotYetValid
};

[[nodiscard]] constexpr std::string_view ToString(const TokenFreshness freshness) noexcept {
    switch (freshness) {
        case TokenFreshness::Fresh: return "fresh";
        case TokenFreshness::Expired: return "expired";
        case TokenFreshness::NotYetValid: return "not yet valid";
    }
    return "unknown";
}

/**
 * @brief Advisory lifetime check for decoded bundles
 *
 * A bundle is fresh from generatedAtUtc - skew until generatedAtUtc + window,
 * the upper bound exclusive. The token format itself carries no expiry, so this
 * is for consumers only; the codec never consults it.
 */
class ExpiryPolicy {
public:
    explicit ExpiryPolicy(
        configuration::CodecConfig config = configuration::CodecConfig::Default()) noexcept;

    [[nodiscard]] TokenFreshness Evaluate(
        const models::CredentialBundle& bundle,
        std::chrono::system_clock::time_point now) const noexcept;

    [[nodiscard]] TokenFreshness Evaluate(const models::CredentialBundle& bundle) const;

    [[nodiscard]] models::UtcSeconds ExpiresAt(const models::CredentialBundle& bundle) const noexcept;

private:
    configuration::CodecConfig config_;
};

} // namespace regtoken::policy
