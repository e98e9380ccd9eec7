#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/configuration/codec_config.hpp"
#include "regtoken/models/credential_bundle.hpp"

#include <string_view>

namespace regtoken::codec {

/**
 * @brief Decodes a registration token back into a CredentialBundle
 *
 * Failure kinds:
 * - MalformedToken: length out of bounds, bad suffix or position, key runs past
 *   the end, cipher length with no base64 padding, invalid base64, or an
 *   envelope too short to hold marker, salt and one cipher block
 * - Decryption: the envelope marker was altered or the padding check failed
 * - MalformedPayload: the plaintext is not a valid credential object
 *
 * The token is taken verbatim; callers trim pasted input themselves.
 * Nothing is retried. Messages never quote the token or the key.
 */
class EnvelopeParser {
public:
    [[nodiscard]] static Result<models::CredentialBundle, TokenFailure> Parse(
        std::string_view token,
        const configuration::CodecConfig& config = configuration::CodecConfig::Default());

private:
    EnvelopeParser() = delete;
};

} // namespace regtoken::codec
