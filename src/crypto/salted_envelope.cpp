#include "regtoken/crypto/salted_envelope.hpp"
#include "regtoken/crypto/aes_cbc.hpp"
#include "regtoken/crypto/pbkdf2.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/core/format.hpp"

#include <algorithm>

namespace regtoken::crypto {

namespace {
    struct DerivedCipherMaterial {
        std::vector<uint8_t> bytes;

        [[nodiscard]] std::span<const uint8_t> Key() const {
            return std::span<const uint8_t>(bytes).first(Constants::AES_KEY_SIZE);
        }
        [[nodiscard]] std::span<const uint8_t> Iv() const {
            return std::span<const uint8_t>(bytes).subspan(
                Constants::AES_KEY_SIZE, Constants::AES_CBC_IV_SIZE);
        }

        DerivedCipherMaterial() = default;
        DerivedCipherMaterial(DerivedCipherMaterial&&) noexcept = default;
        DerivedCipherMaterial& operator=(DerivedCipherMaterial&&) noexcept = default;
        DerivedCipherMaterial(const DerivedCipherMaterial&) = delete;
        DerivedCipherMaterial& operator=(const DerivedCipherMaterial&) = delete;
        ~DerivedCipherMaterial() {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void) _wipe;
        }
    };

    Result<DerivedCipherMaterial, CryptoFailure> DeriveCipherMaterial(
        std::string_view passphrase,
        std::span<const uint8_t> salt) {
        auto derived = Pbkdf2::DeriveKeyBytes(
            passphrase, salt, Constants::PBKDF2_ITERATIONS, Constants::DERIVED_KEY_MATERIAL_SIZE);
        if (derived.IsErr()) {
            return Result<DerivedCipherMaterial, CryptoFailure>::Err(std::move(derived).UnwrapErr());
        }
        DerivedCipherMaterial material;
        material.bytes = std::move(derived).Unwrap();
        return Result<DerivedCipherMaterial, CryptoFailure>::Ok(std::move(material));
    }

    std::span<const uint8_t> MarkerBytes() {
        return std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(Constants::SALT_MARKER.data()),
            Constants::SALT_MARKER_SIZE);
    }
}

Result<std::vector<uint8_t>, CryptoFailure> SaltedEnvelope::Seal(
    std::span<const uint8_t> plaintext,
    std::string_view passphrase) {

    auto salt_result = SodiumInterop::GetRandomBytes(Constants::SALT_SIZE);
    if (salt_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::FromSodiumFailure(salt_result.UnwrapErr()));
    }
    return SealWithSalt(plaintext, passphrase, salt_result.Unwrap());
}

Result<std::vector<uint8_t>, CryptoFailure> SaltedEnvelope::SealWithSalt(
    std::span<const uint8_t> plaintext,
    std::string_view passphrase,
    std::span<const uint8_t> salt) {

    if (salt.size() != Constants::SALT_SIZE) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("Envelope salt must be {} bytes, got {}",
                    Constants::SALT_SIZE, salt.size())));
    }

    auto material_result = DeriveCipherMaterial(passphrase, salt);
    if (material_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            std::move(material_result).UnwrapErr());
    }
    const auto material = std::move(material_result).Unwrap();

    auto encrypt_result = AesCbc::Encrypt(material.Key(), material.Iv(), plaintext);
    if (encrypt_result.IsErr()) {
        return encrypt_result;
    }
    const auto ciphertext = std::move(encrypt_result).Unwrap();

    std::vector<uint8_t> envelope;
    envelope.reserve(HEADER_SIZE + ciphertext.size());
    const auto marker = MarkerBytes();
    envelope.insert(envelope.end(), marker.begin(), marker.end());
    envelope.insert(envelope.end(), salt.begin(), salt.end());
    envelope.insert(envelope.end(), ciphertext.begin(), ciphertext.end());
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, CryptoFailure> SaltedEnvelope::Open(
    std::span<const uint8_t> envelope,
    std::string_view passphrase) {

    if (envelope.size() < MIN_ENVELOPE_SIZE) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidEnvelope(
                compat::format("Envelope is {} bytes, expected at least {}",
                    envelope.size(), MIN_ENVELOPE_SIZE)));
    }

    const auto marker = envelope.first(Constants::SALT_MARKER_SIZE);
    const auto salt = envelope.subspan(Constants::SALT_MARKER_SIZE, Constants::SALT_SIZE);
    const auto ciphertext = envelope.subspan(HEADER_SIZE);

    if (ciphertext.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidEnvelope(
                compat::format("Envelope ciphertext of {} bytes is not block aligned",
                    ciphertext.size())));
    }

    if (!std::equal(marker.begin(), marker.end(), MarkerBytes().begin())) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::MarkerMismatch("Envelope does not start with the salt marker"));
    }

    auto material_result = DeriveCipherMaterial(passphrase, salt);
    if (material_result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            std::move(material_result).UnwrapErr());
    }
    const auto material = std::move(material_result).Unwrap();

    return AesCbc::Decrypt(material.Key(), material.Iv(), ciphertext);
}

} // namespace regtoken::crypto
