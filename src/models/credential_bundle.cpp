#include "regtoken/models/credential_bundle.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"
#include "regtoken/crypto/sodium_interop.hpp"

namespace regtoken::models {
    namespace {
        Result<Unit, TokenFailure> RequireNonEmpty(const std::string& value, const char* field) {
            if (value.empty()) {
                return Result<Unit, TokenFailure>::Err(
                    TokenFailure::InvalidInput(compat::format("Field '{}' is empty", field)));
            }
            return Result<Unit, TokenFailure>::Ok(unit);
        }
    }

    CredentialBundle::CredentialBundle(
        std::string hostname,
        const uint16_t ssh_port,
        std::string ssh_username,
        std::string public_key,
        std::string private_key_pem,
        std::string generated_at_utc,
        const UtcSeconds generated_at)
        : hostname_(std::move(hostname))
        , ssh_port_(ssh_port)
        , ssh_username_(std::move(ssh_username))
        , public_key_(std::move(public_key))
        , private_key_pem_(std::move(private_key_pem))
        , generated_at_utc_(std::move(generated_at_utc))
        , generated_at_(generated_at) {}

    Result<CredentialBundle, TokenFailure> CredentialBundle::Create(
        std::string hostname,
        const uint32_t ssh_port,
        std::string ssh_username,
        std::string public_key,
        std::string private_key_pem,
        std::string generated_at_utc) {

        auto reject = [&private_key_pem](TokenFailure failure) {
            auto _wipe = crypto::SodiumInterop::SecureWipe(private_key_pem);
            (void) _wipe;
            return Result<CredentialBundle, TokenFailure>::Err(std::move(failure));
        };

        for (const auto& [value, field] : {
                 std::pair<const std::string&, const char*>{hostname, "hostname"},
                 std::pair<const std::string&, const char*>{ssh_username, "sshUsername"},
                 std::pair<const std::string&, const char*>{public_key, "publicKey"},
                 std::pair<const std::string&, const char*>{private_key_pem, "privateKeyPem"},
                 std::pair<const std::string&, const char*>{generated_at_utc, "generatedAtUtc"}}) {
            if (auto check = RequireNonEmpty(value, field); check.IsErr()) {
                return reject(std::move(check).UnwrapErr());
            }
        }

        if (ssh_port < PayloadConstants::MIN_SSH_PORT || ssh_port > PayloadConstants::MAX_SSH_PORT) {
            return reject(TokenFailure::InvalidInput(
                compat::format("SSH port {} is outside {}..{}",
                    ssh_port, PayloadConstants::MIN_SSH_PORT, PayloadConstants::MAX_SSH_PORT)));
        }

        if (public_key.find_first_of("\r\n") != std::string::npos) {
            return reject(TokenFailure::InvalidInput("Field 'publicKey' must be a single line"));
        }

        const auto generated_at = ParseUtcTimestamp(generated_at_utc);
        if (!generated_at.has_value()) {
            return reject(TokenFailure::InvalidInput(
                "Field 'generatedAtUtc' is not a YYYY-MM-DDTHH:MM:SSZ timestamp"));
        }

        return Result<CredentialBundle, TokenFailure>::Ok(CredentialBundle(
            std::move(hostname),
            static_cast<uint16_t>(ssh_port),
            std::move(ssh_username),
            std::move(public_key),
            std::move(private_key_pem),
            std::move(generated_at_utc),
            *generated_at));
    }
}
