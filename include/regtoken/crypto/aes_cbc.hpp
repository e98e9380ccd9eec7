#pragma once
#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace regtoken::crypto {

/**
 * AES-256-CBC with PKCS#7 padding.
 *
 * Unauthenticated: a wrong key or a modified ciphertext is only detected when
 * the padding of the final block fails to verify, which happens for all but
 * roughly 1 in 256 random outcomes. Callers must validate the plaintext
 * structure on top of this.
 */
class AesCbc {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> plaintext);
    [[nodiscard]] static Result<std::vector<uint8_t>, CryptoFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> ciphertext);
private:
    AesCbc() = delete;
};
}
