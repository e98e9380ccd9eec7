#include "regtoken/codec/envelope_parser.hpp"
#include "regtoken/codec/payload_serializer.hpp"
#include "regtoken/codec/token_layout.hpp"
#include "regtoken/crypto/salted_envelope.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/encoding/base64.hpp"
#include "regtoken/debug/trace_logger.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"

namespace regtoken::codec {
    using crypto::SaltedEnvelope;
    using crypto::SodiumInterop;
    using encoding::Base64;

    namespace {
        TokenFailure FromCryptoFailure(const CryptoFailure& failure) {
            switch (failure.type) {
                case CryptoFailureType::InvalidEnvelope:
                    return TokenFailure::MalformedToken(failure.message);
                case CryptoFailureType::MarkerMismatch:
                case CryptoFailureType::Decrypt:
                    return TokenFailure::Decryption(failure.message);
                default:
                    return TokenFailure::Decryption(
                        compat::format("Envelope could not be opened: {}", failure.message));
            }
        }
    }

    Result<models::CredentialBundle, TokenFailure> EnvelopeParser::Parse(
        const std::string_view token,
        const configuration::CodecConfig& config) {

        auto layout_result = TokenLayout::Split(token, config.MaxTokenLength());
        if (layout_result.IsErr()) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                std::move(layout_result).UnwrapErr());
        }
        auto layout = std::move(layout_result).Unwrap();
        debug::LogSplice(debug::Stage::Parse, layout.Position(), layout.Before().size(), layout.After().size());

        auto padded_result = TokenLayout::RestoreBase64Padding(layout.CipherText());
        if (padded_result.IsErr()) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                std::move(padded_result).UnwrapErr());
        }

        const auto envelope = Base64::Decode(padded_result.Unwrap());
        if (!envelope.has_value()) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::BAD_BASE64)));
        }

        auto opened = SaltedEnvelope::Open(*envelope, layout.KeyHex());
        layout.WipeKey();
        if (opened.IsErr()) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                FromCryptoFailure(opened.UnwrapErr()));
        }

        auto plaintext = std::move(opened).Unwrap();
        debug::LogEnvelope(debug::Stage::Parse, plaintext.size(), envelope->size(), layout.CipherText().size());

        auto bundle = PayloadSerializer::Deserialize(
            std::string_view(reinterpret_cast<const char*>(plaintext.data()), plaintext.size()));
        {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
            (void) _wipe;
        }
        return bundle;
    }
}
