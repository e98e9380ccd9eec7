#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/core/constants.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace regtoken::crypto {

/**
 * @brief Passphrase-encrypted envelope in the OpenSSL `enc` layout
 *
 * Layout:
 *   [0..7]   "Salted__"
 *   [8..15]  salt
 *   [16..]   AES-256-CBC ciphertext, PKCS#7 padded
 *
 * Key and IV are the first 32 and next 16 bytes of
 * PBKDF2-HMAC-SHA256(passphrase, salt, 100000). The output is byte-compatible
 * with `openssl enc -aes-256-cbc -pbkdf2 -iter 100000 -md sha256`.
 */
class SaltedEnvelope {
public:
    /// Seal with a freshly generated salt.
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Seal(
        std::span<const uint8_t> plaintext,
        std::string_view passphrase);

    /// Seal with a caller-chosen salt; the salt must be exactly 8 bytes.
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> SealWithSalt(
        std::span<const uint8_t> plaintext,
        std::string_view passphrase,
        std::span<const uint8_t> salt);

    /**
     * @brief Open an envelope
     *
     * Failures:
     * - InvalidEnvelope: too short for header plus one block, or ciphertext not
     *   block aligned
     * - MarkerMismatch: the first 8 bytes are not "Salted__"
     * - Decrypt: the final block does not carry valid padding
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure> Open(
        std::span<const uint8_t> envelope,
        std::string_view passphrase);

    static constexpr size_t HEADER_SIZE = Constants::ENVELOPE_HEADER_SIZE;
    static constexpr size_t MIN_ENVELOPE_SIZE = HEADER_SIZE + Constants::AES_BLOCK_SIZE;

private:
    SaltedEnvelope() = delete;
};

} // namespace regtoken::crypto
