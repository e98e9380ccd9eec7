#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace regtoken::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Owns library initialization and is the single source of randomness for the
 * codec (one-time keys, salts, splice positions) and of Ed25519 key generation.
 * libsodium's generator is safe for concurrent use once initialized.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses a volatile loop for small buffers and sodium_memzero for large ones.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Securely wipe the characters of a string and clear it
     *
     * Used for hex-encoded one-time keys and serialized payloads.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::string& text);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     *
     * @return Err if libsodium is not initialized
     */
    static Result<std::vector<uint8_t>, SodiumFailure> GetRandomBytes(size_t size);

    /**
     * @brief Uniform random integer in [lower, upper], both inclusive
     *
     * Uses randombytes_uniform, which has no modulo bias.
     */
    static Result<uint32_t, SodiumFailure> GenerateRandomInRange(uint32_t lower, uint32_t upper);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate Ed25519 key pair
     *
     * The secret key is libsodium's 64-byte form (seed || public key), which is
     * also the layout OpenSSH stores.
     *
     * @return Ok((secret_key, public_key)) or Err
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>
    GenerateEd25519KeyPair();

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace regtoken::crypto
