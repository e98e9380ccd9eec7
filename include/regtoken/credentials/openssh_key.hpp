#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace regtoken::credentials {

/**
 * @brief OpenSSH encodings of an Ed25519 key pair
 *
 * Produces the same text `ssh-keygen -t ed25519 -N ""` writes: the
 * authorized_keys line, the unencrypted openssh-key-v1 private key block and the
 * `SHA256:` fingerprint shown by `ssh-keygen -l`.
 *
 * secret_key is libsodium's 64-byte form (seed || public key).
 */
class OpenSshKey {
public:
    /// Wire blob: string "ssh-ed25519" || string public_key.
    [[nodiscard]] static Result<std::vector<uint8_t>, CredentialFailure> PublicKeyBlob(
        std::span<const uint8_t> public_key);

    /// `ssh-ed25519 <base64 blob> <comment>`, comment omitted when empty.
    [[nodiscard]] static Result<std::string, CredentialFailure> PublicKeyLine(
        std::span<const uint8_t> public_key,
        std::string_view comment);

    /// Armored private key with a random check integer; ends with a newline.
    [[nodiscard]] static Result<std::string, CredentialFailure> PrivateKeyPem(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> public_key,
        std::string_view comment);

    [[nodiscard]] static Result<std::string, CredentialFailure> PrivateKeyPemWithCheckInt(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> public_key,
        std::string_view comment,
        uint32_t check_int);

    /// `SHA256:` followed by the unpadded base64 SHA-256 of the blob.
    [[nodiscard]] static Result<std::string, CredentialFailure> Fingerprint(
        std::span<const uint8_t> public_key);

private:
    OpenSshKey() = delete;
};

} // namespace regtoken::credentials
