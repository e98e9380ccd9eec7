#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/core/format.hpp"

#include <string>

namespace regtoken::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_init returns 1 when already initialized elsewhere in the process.
        initialized_.store(sodium_init() >= SodiumConstants::SUCCESS, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::string& text) {
    auto wipe_result = SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(text.data()), text.size()));
    text.clear();
    return wipe_result;
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::GetRandomBytes(const size_t size) {
    if (!IsInitialized()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), buffer.size());
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(buffer));
}

Result<uint32_t, SodiumFailure> SodiumInterop::GenerateRandomInRange(
    const uint32_t lower,
    const uint32_t upper) {
    if (!IsInitialized()) {
        return Result<uint32_t, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (upper < lower || upper - lower == UINT32_MAX) {
        return Result<uint32_t, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(
                compat::format("Invalid random range [{}, {}]", lower, upper)));
    }
    return Result<uint32_t, SodiumFailure>::Ok(lower + randombytes_uniform(upper - lower + 1));
}

// ============================================================================
// Key Generation
// ============================================================================

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    if (!IsInitialized()) {
        return Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    std::vector<uint8_t> pk(crypto_sign_PUBLICKEYBYTES);
    std::vector<uint8_t> sk(crypto_sign_SECRETKEYBYTES);

    if (crypto_sign_keypair(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        auto _wipe = SecureWipe(std::span<uint8_t>(sk));
        (void) _wipe;
        return Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>::Err(
            SodiumFailure::KeyGenerationFailed("Failed to generate Ed25519 key pair"));
    }

    return Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, SodiumFailure>::Ok(
        std::make_pair(std::move(sk), std::move(pk)));
}

} // namespace regtoken::crypto
