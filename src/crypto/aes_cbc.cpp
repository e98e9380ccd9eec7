#include "regtoken/crypto/aes_cbc.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
namespace regtoken::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    void WipeOutput(std::vector<uint8_t>& output) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        (void)_wipe;
    }
    Result<Unit, CryptoFailure> ValidateKeyAndIv(
        std::span<const uint8_t> key,
        std::span<const uint8_t> iv) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::InvalidInput(
                    compat::format("AES-256-CBC key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (iv.size() != Constants::AES_CBC_IV_SIZE) {
            return Result<Unit, CryptoFailure>::Err(
                CryptoFailure::InvalidInput(
                    compat::format("AES-CBC IV must be {} bytes, got {}",
                        Constants::AES_CBC_IV_SIZE, iv.size())));
        }
        return Result<Unit, CryptoFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, CryptoFailure>
AesCbc::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> plaintext) {
    if (auto check = ValidateKeyAndIv(key, iv); check.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(check).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Encrypt(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Encrypt(
                compat::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
    }
    // PKCS#7 always appends between 1 and 16 bytes.
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_BLOCK_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() && EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Encrypt(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Encrypt(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len + final_len));
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CryptoFailure>
AesCbc::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> iv,
    std::span<const uint8_t> ciphertext) {
    if (auto check = ValidateKeyAndIv(key, iv); check.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext.empty() || ciphertext.size() % Constants::AES_BLOCK_SIZE != 0) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::InvalidEnvelope(
                compat::format("Ciphertext length {} is not a positive multiple of {}",
                    ciphertext.size(), Constants::AES_BLOCK_SIZE)));
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Decrypt(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Decrypt(
                compat::format("Failed to initialize AES-256-CBC: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(ciphertext.size() + Constants::AES_BLOCK_SIZE);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Decrypt(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeOutput(output);
        ERR_clear_error();
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            CryptoFailure::Decrypt(std::string(ErrorMessages::PADDING_INVALID)));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}
}
