#include "regtoken/codec/envelope_builder.hpp"
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
    using encoding::Hex;

    namespace {
        Result<std::string, TokenFailure> GenerateOneTimeKeyHex() {
            auto key_result = SodiumInterop::GetRandomBytes(Constants::ONE_TIME_KEY_SIZE);
            if (key_result.IsErr()) {
                return Result<std::string, TokenFailure>::Err(
                    TokenFailure::FromSodiumFailure(key_result.UnwrapErr()));
            }
            auto key = std::move(key_result).Unwrap();
            std::string key_hex = Hex::Encode(key);
            {
                auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(key));
                (void) _wipe;
            }
            return Result<std::string, TokenFailure>::Ok(std::move(key_hex));
        }

        Result<std::string, TokenFailure> SealPayload(std::string& payload, const std::string& key_hex) {
            auto sealed = SaltedEnvelope::Seal(
                std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()),
                key_hex);
            const size_t payload_length = payload.size();
            {
                auto _wipe = SodiumInterop::SecureWipe(payload);
                (void) _wipe;
            }
            if (sealed.IsErr()) {
                return Result<std::string, TokenFailure>::Err(
                    TokenFailure::Encoding(
                        compat::format("Failed to seal credential payload: {}", sealed.UnwrapErr().message)));
            }
            const auto& envelope = sealed.Unwrap();
            std::string cipher_text(TokenLayout::StripBase64Padding(Base64::Encode(envelope)));
            debug::LogEnvelope(debug::Stage::Build, payload_length, envelope.size(), cipher_text.size());
            return Result<std::string, TokenFailure>::Ok(std::move(cipher_text));
        }
    }

    Result<std::string, TokenFailure> EnvelopeBuilder::Build(const models::CredentialBundle& bundle) {
        auto position_result = SodiumInterop::GenerateRandomInRange(
            TokenConstants::MIN_SPLICE_POSITION, TokenConstants::MAX_SPLICE_POSITION);
        if (position_result.IsErr()) {
            return Result<std::string, TokenFailure>::Err(
                TokenFailure::FromSodiumFailure(position_result.UnwrapErr()));
        }
        return BuildAtPosition(bundle, position_result.Unwrap());
    }

    Result<std::string, TokenFailure> EnvelopeBuilder::BuildAtPosition(
        const models::CredentialBundle& bundle,
        const uint32_t position) {

        if (position < TokenConstants::MIN_SPLICE_POSITION || position > TokenConstants::MAX_SPLICE_POSITION) {
            return Result<std::string, TokenFailure>::Err(
                TokenFailure::InvalidInput(
                    compat::format("Splice position {} is outside {}..{}",
                        position,
                        TokenConstants::MIN_SPLICE_POSITION,
                        TokenConstants::MAX_SPLICE_POSITION)));
        }

        auto payload_result = PayloadSerializer::Serialize(bundle);
        if (payload_result.IsErr()) {
            return payload_result;
        }
        auto payload = std::move(payload_result).Unwrap();

        auto key_result = GenerateOneTimeKeyHex();
        if (key_result.IsErr()) {
            auto _wipe = SodiumInterop::SecureWipe(payload);
            (void) _wipe;
            return key_result;
        }
        auto key_hex = std::move(key_result).Unwrap();

        auto cipher_result = SealPayload(payload, key_hex);
        if (cipher_result.IsErr()) {
            auto _wipe = SodiumInterop::SecureWipe(key_hex);
            (void) _wipe;
            return cipher_result;
        }
        const auto cipher_text = std::move(cipher_result).Unwrap();

        auto layout_result = TokenLayout::Splice(cipher_text, key_hex, position);
        {
            auto _wipe = SodiumInterop::SecureWipe(key_hex);
            (void) _wipe;
        }
        if (layout_result.IsErr()) {
            return Result<std::string, TokenFailure>::Err(
                TokenFailure::Encoding(layout_result.UnwrapErr().message));
        }
        const auto& layout = layout_result.Unwrap();
        debug::LogSplice(debug::Stage::Build, layout.Position(), layout.Before().size(), layout.After().size());

        return layout.Assemble();
    }
}
