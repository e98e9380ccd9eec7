/**
 * @file regtoken_api.cpp
 * @brief C ABI over the token codec
 */

#include "regtoken/c_api/regtoken_api.h"
#include "regtoken/codec/envelope_builder.hpp"
#include "regtoken/codec/envelope_parser.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/models/credential_bundle.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <string>
#include <string_view>

using namespace regtoken;
using regtoken::codec::EnvelopeBuilder;
using regtoken::codec::EnvelopeParser;
using regtoken::crypto::SodiumInterop;
using regtoken::models::CredentialBundle;

namespace regtoken_capi::internal {

RegtokenErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? REGTOKEN_SUCCESS
               : REGTOKEN_ERROR_SODIUM_FAILURE;
}

char* duplicate_string(const std::string_view value) {
    auto* copy = static_cast<char*>(std::malloc(value.size() + 1));
    if (copy) {
        std::memcpy(copy, value.data(), value.size());
        copy[value.size()] = '\0';
    }
    return copy;
}

void fill_error(RegtokenError* out_error, const RegtokenErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
        out_error->message = duplicate_string(message);
    }
}

RegtokenErrorCode fill_error_from_failure(RegtokenError* out_error, const TokenFailure& failure) {
    RegtokenErrorCode code = REGTOKEN_ERROR_GENERIC;

    switch (failure.type) {
        case TokenFailureType::Encoding:
            code = REGTOKEN_ERROR_ENCODING;
            break;
        case TokenFailureType::MalformedToken:
            code = REGTOKEN_ERROR_MALFORMED_TOKEN;
            break;
        case TokenFailureType::Decryption:
            code = REGTOKEN_ERROR_DECRYPTION;
            break;
        case TokenFailureType::MalformedPayload:
            code = REGTOKEN_ERROR_MALFORMED_PAYLOAD;
            break;
        case TokenFailureType::InvalidInput:
            code = REGTOKEN_ERROR_INVALID_INPUT;
            break;
        default:
            code = REGTOKEN_ERROR_GENERIC;
            break;
    }

    fill_error(out_error, code, failure.message);
    return code;
}

void wipe_and_free(char*& value) {
    if (value) {
        auto _wipe = SodiumInterop::SecureWipe(std::span(
            reinterpret_cast<uint8_t*>(value), std::strlen(value)));
        (void) _wipe;
        std::free(value);
        value = nullptr;
    }
}

} // namespace regtoken_capi::internal

using namespace regtoken_capi::internal;

extern "C" {

const char* regtoken_version(void) {
    return "1.0.0";
}

RegtokenErrorCode regtoken_init(void) {
    return EnsureInitialized();
}

RegtokenErrorCode regtoken_encode(
    const RegtokenCredentials* credentials,
    char** out_token,
    RegtokenError* out_error) {
    if (const auto err = EnsureInitialized(); err != REGTOKEN_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if (!credentials || !out_token) {
        fill_error(out_error, REGTOKEN_ERROR_NULL_POINTER, "Credentials or output pointer is null");
        return REGTOKEN_ERROR_NULL_POINTER;
    }
    if (!credentials->hostname || !credentials->ssh_username || !credentials->public_key ||
        !credentials->private_key_pem || !credentials->generated_at_utc) {
        fill_error(out_error, REGTOKEN_ERROR_NULL_POINTER, "A credential field is null");
        return REGTOKEN_ERROR_NULL_POINTER;
    }
    *out_token = nullptr;

    try {
        auto bundle = CredentialBundle::Create(
            credentials->hostname,
            credentials->ssh_port,
            credentials->ssh_username,
            credentials->public_key,
            credentials->private_key_pem,
            credentials->generated_at_utc);
        if (bundle.IsErr()) {
            return fill_error_from_failure(out_error, bundle.UnwrapErr());
        }

        auto token = EnvelopeBuilder::Build(bundle.Unwrap());
        if (token.IsErr()) {
            return fill_error_from_failure(out_error, token.UnwrapErr());
        }

        *out_token = duplicate_string(token.Unwrap());
        if (!*out_token) {
            fill_error(out_error, REGTOKEN_ERROR_OUT_OF_MEMORY, "Failed to allocate token string");
            return REGTOKEN_ERROR_OUT_OF_MEMORY;
        }
        return REGTOKEN_SUCCESS;
    } catch (const std::bad_alloc&) {
        fill_error(out_error, REGTOKEN_ERROR_OUT_OF_MEMORY, "Out of memory during encode");
        return REGTOKEN_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& ex) {
        fill_error(out_error, REGTOKEN_ERROR_GENERIC, std::string("Exception during encode: ") + ex.what());
        return REGTOKEN_ERROR_GENERIC;
    }
}

RegtokenErrorCode regtoken_decode(
    const char* token,
    const size_t token_length,
    RegtokenCredentials* out_credentials,
    RegtokenError* out_error) {
    if (const auto err = EnsureInitialized(); err != REGTOKEN_SUCCESS) {
        fill_error(out_error, err, "Failed to initialize libsodium");
        return err;
    }
    if ((!token && token_length > 0) || !out_credentials) {
        fill_error(out_error, REGTOKEN_ERROR_NULL_POINTER, "Token or output credentials pointer is null");
        return REGTOKEN_ERROR_NULL_POINTER;
    }
    *out_credentials = RegtokenCredentials{};

    try {
        const std::string_view token_view = token ? std::string_view(token, token_length) : std::string_view{};
        auto bundle_result = EnvelopeParser::Parse(token_view);
        if (bundle_result.IsErr()) {
            return fill_error_from_failure(out_error, bundle_result.UnwrapErr());
        }
        const auto& bundle = bundle_result.Unwrap();

        RegtokenCredentials filled{};
        filled.hostname = duplicate_string(bundle.Hostname());
        filled.ssh_port = bundle.SshPort();
        filled.ssh_username = duplicate_string(bundle.SshUsername());
        filled.public_key = duplicate_string(bundle.PublicKey());
        filled.private_key_pem = duplicate_string(bundle.PrivateKeyPem());
        filled.generated_at_utc = duplicate_string(bundle.GeneratedAtUtc());
        if (!filled.hostname || !filled.ssh_username || !filled.public_key ||
            !filled.private_key_pem || !filled.generated_at_utc) {
            regtoken_credentials_free(&filled);
            fill_error(out_error, REGTOKEN_ERROR_OUT_OF_MEMORY, "Failed to allocate credential strings");
            return REGTOKEN_ERROR_OUT_OF_MEMORY;
        }
        *out_credentials = filled;
        return REGTOKEN_SUCCESS;
    } catch (const std::bad_alloc&) {
        fill_error(out_error, REGTOKEN_ERROR_OUT_OF_MEMORY, "Out of memory during decode");
        return REGTOKEN_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& ex) {
        fill_error(out_error, REGTOKEN_ERROR_GENERIC, std::string("Exception during decode: ") + ex.what());
        return REGTOKEN_ERROR_GENERIC;
    }
}

void regtoken_credentials_free(RegtokenCredentials* credentials) {
    if (credentials) {
        wipe_and_free(credentials->hostname);
        wipe_and_free(credentials->ssh_username);
        wipe_and_free(credentials->public_key);
        wipe_and_free(credentials->private_key_pem);
        wipe_and_free(credentials->generated_at_utc);
        credentials->ssh_port = 0;
    }
}

void regtoken_string_free(char* value) {
    wipe_and_free(value);
}

void regtoken_error_free(RegtokenError* error) {
    if (error && error->message) {
        std::free(error->message);
        error->message = nullptr;
    }
}

const char* regtoken_error_string(const RegtokenErrorCode code) {
    switch (code) {
        case REGTOKEN_SUCCESS: return "Success";
        case REGTOKEN_ERROR_GENERIC: return "Generic error";
        case REGTOKEN_ERROR_INVALID_INPUT: return "Invalid input";
        case REGTOKEN_ERROR_ENCODING: return "Token encoding failed";
        case REGTOKEN_ERROR_MALFORMED_TOKEN: return "Malformed token";
        case REGTOKEN_ERROR_DECRYPTION: return "Token decryption failed";
        case REGTOKEN_ERROR_MALFORMED_PAYLOAD: return "Malformed token payload";
        case REGTOKEN_ERROR_NULL_POINTER: return "Null pointer";
        case REGTOKEN_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case REGTOKEN_ERROR_SODIUM_FAILURE: return "Libsodium failure";
        default: return "Unknown error";
    }
}

} // extern "C"
