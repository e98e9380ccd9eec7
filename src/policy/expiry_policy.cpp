#include "regtoken/policy/expiry_policy.hpp"

namespace regtoken::policy {
    ExpiryPolicy::ExpiryPolicy(const configuration::CodecConfig config) noexcept
        : config_(config) {}

    TokenFreshness ExpiryPolicy::Evaluate(
        const models::CredentialBundle& bundle,
        const std::chrono::system_clock::time_point now) const noexcept {

        if (now < bundle.GeneratedAt() - config_.ClockSkewTolerance()) {
            return TokenFreshness::NotYetValid;
        }
        if (now >= ExpiresAt(bundle)) {
            return TokenFreshness::Expired;
        }
        return TokenFreshness::Fresh;
    }

    TokenFreshness ExpiryPolicy::Evaluate(const models::CredentialBundle& bundle) const {
        return Evaluate(bundle, std::chrono::system_clock::now());
    }

    models::UtcSeconds ExpiryPolicy::ExpiresAt(const models::CredentialBundle& bundle) const noexcept {
        return bundle.GeneratedAt() + config_.ValidityWindow();
    }
}
