#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/models/credential_bundle.hpp"

#include <string>
#include <string_view>

namespace regtoken::codec {

/**
 * @brief JSON form of a CredentialBundle
 *
 * One flat object with the keys hostname, sshPort, sshUsername, publicKey,
 * privateKeyPem and generatedAtUtc. sshPort is a JSON number; string escaping
 * (quotes, backslashes, the line breaks of privateKeyPem as `\n`) is protobuf's
 * JSON mapping.
 */
class PayloadSerializer {
public:
    /// Fails with Encoding when a field is not valid UTF-8.
    [[nodiscard]] static Result<std::string, TokenFailure> Serialize(
        const models::CredentialBundle& bundle);

    /**
     * Fails with MalformedPayload when the text is not a JSON object, a field is
     * missing or mistyped, or the values violate the bundle invariants.
     * Trailing whitespace after the object is ignored.
     */
    [[nodiscard]] static Result<models::CredentialBundle, TokenFailure> Deserialize(
        std::string_view json);

private:
    PayloadSerializer() = delete;
};

} // namespace regtoken::codec
