#include "regtoken/credentials/openssh_key.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/encoding/base64.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"

#include <sodium.h>

namespace regtoken::credentials {
    using crypto::SodiumInterop;
    using encoding::Base64;

    namespace {
        class SshWriter {
        public:
            void WriteUint32(const uint32_t value) {
                buffer_.push_back(static_cast<uint8_t>(value >> 24));
                buffer_.push_back(static_cast<uint8_t>(value >> 16));
                buffer_.push_back(static_cast<uint8_t>(value >> 8));
                buffer_.push_back(static_cast<uint8_t>(value));
            }

            void WriteString(std::span<const uint8_t> bytes) {
                WriteUint32(static_cast<uint32_t>(bytes.size()));
                buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
            }

            void WriteString(const std::string_view text) {
                WriteString(std::span<const uint8_t>(
                    reinterpret_cast<const uint8_t*>(text.data()), text.size()));
            }

            void WriteRaw(const std::string_view text) {
                buffer_.insert(buffer_.end(), text.begin(), text.end());
            }

            void WriteByte(const uint8_t value) {
                buffer_.push_back(value);
            }

            [[nodiscard]] size_t Size() const noexcept { return buffer_.size(); }
            [[nodiscard]] std::vector<uint8_t>& Buffer() noexcept { return buffer_; }

        private:
            std::vector<uint8_t> buffer_;
        };

        Result<Unit, CredentialFailure> RequireSize(
            std::span<const uint8_t> bytes, const size_t expected, const char* what) {
            if (bytes.size() != expected) {
                return Result<Unit, CredentialFailure>::Err(
                    CredentialFailure::InvalidInput(
                        compat::format("Ed25519 {} must be {} bytes, got {}", what, expected, bytes.size())));
            }
            return Result<Unit, CredentialFailure>::Ok(unit);
        }
    }

    Result<std::vector<uint8_t>, CredentialFailure> OpenSshKey::PublicKeyBlob(
        std::span<const uint8_t> public_key) {
        if (auto check = RequireSize(public_key, OpenSshConstants::ED_25519_PUBLIC_KEY_SIZE, "public key");
            check.IsErr()) {
            return Result<std::vector<uint8_t>, CredentialFailure>::Err(std::move(check).UnwrapErr());
        }
        SshWriter writer;
        writer.WriteString(OpenSshConstants::KEY_TYPE);
        writer.WriteString(public_key);
        return Result<std::vector<uint8_t>, CredentialFailure>::Ok(std::move(writer.Buffer()));
    }

    Result<std::string, CredentialFailure> OpenSshKey::PublicKeyLine(
        std::span<const uint8_t> public_key,
        const std::string_view comment) {
        auto blob = PublicKeyBlob(public_key);
        if (blob.IsErr()) {
            return Result<std::string, CredentialFailure>::Err(std::move(blob).UnwrapErr());
        }
        std::string line = compat::format("{} {}", OpenSshConstants::KEY_TYPE, Base64::Encode(blob.Unwrap()));
        if (!comment.empty()) {
            line.push_back(' ');
            line.append(comment);
        }
        return Result<std::string, CredentialFailure>::Ok(std::move(line));
    }

    Result<std::string, CredentialFailure> OpenSshKey::PrivateKeyPem(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> public_key,
        const std::string_view comment) {
        if (!SodiumInterop::IsInitialized()) {
            return Result<std::string, CredentialFailure>::Err(
                CredentialFailure::KeyGeneration(std::string(ErrorMessages::NOT_INITIALIZED)));
        }
        return PrivateKeyPemWithCheckInt(secret_key, public_key, comment, randombytes_random());
    }

    Result<std::string, CredentialFailure> OpenSshKey::PrivateKeyPemWithCheckInt(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> public_key,
        const std::string_view comment,
        const uint32_t check_int) {
        if (auto check = RequireSize(secret_key, OpenSshConstants::ED_25519_SECRET_KEY_SIZE, "secret key");
            check.IsErr()) {
            return Result<std::string, CredentialFailure>::Err(std::move(check).UnwrapErr());
        }
        auto blob = PublicKeyBlob(public_key);
        if (blob.IsErr()) {
            return Result<std::string, CredentialFailure>::Err(std::move(blob).UnwrapErr());
        }

        SshWriter private_section;
        private_section.WriteUint32(check_int);
        private_section.WriteUint32(check_int);
        private_section.WriteString(OpenSshConstants::KEY_TYPE);
        private_section.WriteString(public_key);
        private_section.WriteString(secret_key);
        private_section.WriteString(comment);
        for (uint8_t pad = 1; private_section.Size() % OpenSshConstants::CIPHER_BLOCK_SIZE != 0; ++pad) {
            private_section.WriteByte(pad);
        }

        SshWriter body;
        body.WriteRaw(OpenSshConstants::AUTH_MAGIC);
        body.WriteByte(0);
        body.WriteString(OpenSshConstants::CIPHER_NONE);
        body.WriteString(OpenSshConstants::KDF_NONE);
        body.WriteString(std::string_view{});
        body.WriteUint32(1);
        body.WriteString(blob.Unwrap());
        body.WriteString(private_section.Buffer());

        std::string armored_body = Base64::Encode(body.Buffer());
        {
            auto _wipe_private = SodiumInterop::SecureWipe(std::span<uint8_t>(private_section.Buffer()));
            (void) _wipe_private;
            auto _wipe_body = SodiumInterop::SecureWipe(std::span<uint8_t>(body.Buffer()));
            (void) _wipe_body;
        }

        std::string pem;
        pem.reserve(armored_body.size() + armored_body.size() / OpenSshConstants::ARMOR_LINE_WIDTH + 80);
        pem.append(OpenSshConstants::PRIVATE_KEY_BEGIN);
        pem.push_back('\n');
        for (size_t offset = 0; offset < armored_body.size(); offset += OpenSshConstants::ARMOR_LINE_WIDTH) {
            pem.append(armored_body, offset, OpenSshConstants::ARMOR_LINE_WIDTH);
            pem.push_back('\n');
        }
        pem.append(OpenSshConstants::PRIVATE_KEY_END);
        pem.push_back('\n');
        {
            auto _wipe = SodiumInterop::SecureWipe(armored_body);
            (void) _wipe;
        }
        return Result<std::string, CredentialFailure>::Ok(std::move(pem));
    }

    Result<std::string, CredentialFailure> OpenSshKey::Fingerprint(std::span<const uint8_t> public_key) {
        auto blob = PublicKeyBlob(public_key);
        if (blob.IsErr()) {
            return Result<std::string, CredentialFailure>::Err(std::move(blob).UnwrapErr());
        }
        const auto& blob_bytes = blob.Unwrap();
        std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
        crypto_hash_sha256(digest.data(), blob_bytes.data(), blob_bytes.size());
        return Result<std::string, CredentialFailure>::Ok(
            compat::format("{}{}", OpenSshConstants::FINGERPRINT_PREFIX, Base64::EncodeUnpadded(digest)));
    }
}
