#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/models/credential_bundle.hpp"

#include <cstdint>
#include <string>

namespace regtoken::codec {

/**
 * @brief Encodes a CredentialBundle into a registration token
 *
 * Steps: serialize to JSON, seal under a fresh 32-byte one-time key (its hex
 * string is the passphrase), base64 without '=' padding, splice the hex key in at
 * a random position in 10..99 and append the position suffix.
 *
 * The one-time key and the serialized payload are wiped before returning.
 * Every failure is reported as TokenFailureType::Encoding, except an out-of-range
 * position passed to BuildAtPosition, which is InvalidInput.
 *
 * Requires SodiumInterop::Initialize().
 */
class EnvelopeBuilder {
public:
    [[nodiscard]] static Result<std::string, TokenFailure> Build(
        const models::CredentialBundle& bundle);

    /// Build with a caller-chosen splice position instead of a random one.
    [[nodiscard]] static Result<std::string, TokenFailure> BuildAtPosition(
        const models::CredentialBundle& bundle,
        uint32_t position);

private:
    EnvelopeBuilder() = delete;
};

} // namespace regtoken::codec
