#include "regtoken/crypto/pbkdf2.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>

namespace regtoken::crypto {

using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, CryptoFailure> Pbkdf2::DeriveKey(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    uint32_t iterations,
    std::span<uint8_t> output) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidInput(
                compat::format("PBKDF2 output size must be in [1, {}], got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }

    if (iterations == 0) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::InvalidInput("PBKDF2 iteration count cannot be zero"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_PBKDF2.data(), nullptr);
    if (!kdf) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DeriveKey("Failed to fetch PBKDF2 algorithm"));
    }

    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DeriveKey("Failed to create PBKDF2 context"));
    }

    unsigned int iteration_count = iterations;
    int disable_lower_bound_checks = 1;

    OSSL_PARAM params[6];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(OpenSSL::ALGORITHM_SHA256.data()), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSL::PARAM_PASSWORD.data(), const_cast<char*>(passphrase.data()), passphrase.size());

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSL::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());

    params[param_idx++] = OSSL_PARAM_construct_uint(
        OpenSSL::PARAM_ITERATIONS.data(), &iteration_count);

    params[param_idx++] = OSSL_PARAM_construct_int(
        OpenSSL::PARAM_PKCS5.data(), &disable_lower_bound_checks);

    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
        return Result<Unit, CryptoFailure>::Err(
            CryptoFailure::DeriveKey("PBKDF2 key derivation failed"));
    }

    return Result<Unit, CryptoFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CryptoFailure> Pbkdf2::DeriveKeyBytes(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    uint32_t iterations,
    size_t output_size) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(passphrase, salt, iterations, output);

    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, CryptoFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, CryptoFailure>::Ok(std::move(output));
}

} // namespace regtoken::crypto
