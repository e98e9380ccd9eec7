#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>
#include <string_view>

namespace regtoken::crypto {

/**
 * @brief PBKDF2 (RFC 8018) wrapper using HMAC-SHA256
 *
 * Stretches a passphrase into key material. The token envelope derives 48 bytes
 * per call: the AES-256 key followed by the CBC IV, the same split OpenSSL's
 * `enc -pbkdf2` uses.
 *
 * SP 800-132 lower-bound checks are switched off: the envelope format fixes an
 * 8-byte salt, which a strict provider would reject.
 */
class Pbkdf2 {
public:
    /**
     * @brief Derive key material into a caller-supplied buffer
     *
     * @param passphrase Password bytes, used verbatim
     * @param salt Salt bytes
     * @param iterations Iteration count, must be non-zero
     * @param output Output buffer to fill
     * @return Ok on success, Err on failure
     */
    static Result<Unit, CryptoFailure> DeriveKey(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        std::span<uint8_t> output);

    /**
     * @brief Derive key material and return it as a vector
     */
    static Result<std::vector<uint8_t>, CryptoFailure> DeriveKeyBytes(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        size_t output_size);

    static constexpr size_t MAX_OUTPUT_LEN = 1024;

private:
    Pbkdf2() = delete;
};

} // namespace regtoken::crypto
