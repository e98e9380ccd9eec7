#include "regtoken/codec/payload_serializer.hpp"
#include "regtoken/core/format.hpp"
#include "payload/credential_bundle.pb.h"

#include <google/protobuf/util/json_util.h>

namespace regtoken::codec {
    using proto::payload::CredentialBundlePayload;

    namespace {
        constexpr std::string_view WHITESPACE = " \t\r\n";

        // Strict: rejects overlong forms, surrogates and code points above U+10FFFF.
        bool IsValidUtf8(const std::string_view text) noexcept {
            size_t i = 0;
            while (i < text.size()) {
                const auto lead = static_cast<uint8_t>(text[i]);
                size_t continuation = 0;
                uint32_t code_point = 0;
                uint32_t min_code_point = 0;
                if (lead < 0x80) {
                    ++i;
                    continue;
                }
                if ((lead & 0xE0) == 0xC0) {
                    continuation = 1;
                    code_point = lead & 0x1F;
                    min_code_point = 0x80;
                } else if ((lead & 0xF0) == 0xE0) {
                    continuation = 2;
                    code_point = lead & 0x0F;
                    min_code_point = 0x800;
                } else if ((lead & 0xF8) == 0xF0) {
                    continuation = 3;
                    code_point = lead & 0x07;
                    min_code_point = 0x10000;
                } else {
                    return false;
                }
                if (i + continuation >= text.size()) {
                    return false;
                }
                for (size_t k = 1; k <= continuation; ++k) {
                    const auto byte = static_cast<uint8_t>(text[i + k]);
                    if ((byte & 0xC0) != 0x80) {
                        return false;
                    }
                    code_point = (code_point << 6) | (byte & 0x3F);
                }
                if (code_point < min_code_point || code_point > 0x10FFFF ||
                    (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                    return false;
                }
                i += continuation + 1;
            }
            return true;
        }

        Result<Unit, TokenFailure> RequireUtf8(const std::string& value, const char* field) {
            if (!IsValidUtf8(value)) {
                return Result<Unit, TokenFailure>::Err(
                    TokenFailure::Encoding(compat::format("Field '{}' is not valid UTF-8", field)));
            }
            return Result<Unit, TokenFailure>::Ok(unit);
        }

        const char* FirstMissingField(const CredentialBundlePayload& payload) {
            if (!payload.has_hostname()) return "hostname";
            if (!payload.has_ssh_port()) return "sshPort";
            if (!payload.has_ssh_username()) return "sshUsername";
            if (!payload.has_public_key()) return "publicKey";
            if (!payload.has_private_key_pem()) return "privateKeyPem";
            if (!payload.has_generated_at_utc()) return "generatedAtUtc";
            return nullptr;
        }
    }

    Result<std::string, TokenFailure> PayloadSerializer::Serialize(
        const models::CredentialBundle& bundle) {

        for (const auto& [value, field] : {
                 std::pair<const std::string&, const char*>{bundle.Hostname(), "hostname"},
                 std::pair<const std::string&, const char*>{bundle.SshUsername(), "sshUsername"},
                 std::pair<const std::string&, const char*>{bundle.PublicKey(), "publicKey"},
                 std::pair<const std::string&, const char*>{bundle.PrivateKeyPem(), "privateKeyPem"},
                 std::pair<const std::string&, const char*>{bundle.GeneratedAtUtc(), "generatedAtUtc"}}) {
            if (auto check = RequireUtf8(value, field); check.IsErr()) {
                return Result<std::string, TokenFailure>::Err(std::move(check).UnwrapErr());
            }
        }

        CredentialBundlePayload payload;
        payload.set_hostname(bundle.Hostname());
        payload.set_ssh_port(bundle.SshPort());
        payload.set_ssh_username(bundle.SshUsername());
        payload.set_public_key(bundle.PublicKey());
        payload.set_private_key_pem(bundle.PrivateKeyPem());
        payload.set_generated_at_utc(bundle.GeneratedAtUtc());

        std::string json;
        try {
            google::protobuf::util::JsonPrintOptions options;
            options.preserve_proto_field_names = false;
            const auto status = google::protobuf::util::MessageToJsonString(payload, &json, options);
            if (!status.ok()) {
                return Result<std::string, TokenFailure>::Err(
                    TokenFailure::Encoding(
                        compat::format("Failed to serialize credential payload: {}",
                            std::string(status.message()))));
            }
        } catch (const std::exception& ex) {
            return Result<std::string, TokenFailure>::Err(
                TokenFailure::Encoding(
                    compat::format("Exception during payload serialization: {}", ex.what())));
        }
        return Result<std::string, TokenFailure>::Ok(std::move(json));
    }

    Result<models::CredentialBundle, TokenFailure> PayloadSerializer::Deserialize(
        std::string_view json) {

        const auto last = json.find_last_not_of(WHITESPACE);
        json = last == std::string_view::npos ? std::string_view{} : json.substr(0, last + 1);

        if (!IsValidUtf8(json)) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                TokenFailure::MalformedPayload("Decrypted payload is not valid UTF-8"));
        }

        CredentialBundlePayload payload;
        try {
            google::protobuf::util::JsonParseOptions options;
            options.ignore_unknown_fields = true;
            const auto status = google::protobuf::util::JsonStringToMessage(
                std::string(json), &payload, options);
            if (!status.ok()) {
                return Result<models::CredentialBundle, TokenFailure>::Err(
                    TokenFailure::MalformedPayload(
                        compat::format("Decrypted payload is not a credential object: {}",
                            std::string(status.message()))));
            }
        } catch (const std::exception& ex) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                TokenFailure::MalformedPayload(
                    compat::format("Exception during payload parsing: {}", ex.what())));
        }

        if (const char* missing = FirstMissingField(payload); missing != nullptr) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                TokenFailure::MalformedPayload(
                    compat::format("Decrypted payload is missing '{}'", missing)));
        }

        auto bundle = models::CredentialBundle::Create(
            payload.hostname(),
            payload.ssh_port(),
            payload.ssh_username(),
            payload.public_key(),
            payload.private_key_pem(),
            payload.generated_at_utc());
        if (bundle.IsErr()) {
            return Result<models::CredentialBundle, TokenFailure>::Err(
                TokenFailure::MalformedPayload(bundle.UnwrapErr().message));
        }
        return bundle;
    }
}
