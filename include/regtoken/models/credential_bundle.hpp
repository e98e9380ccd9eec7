#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/models/utc_timestamp.hpp"

#include <cstdint>
#include <string>

namespace regtoken::models {

/**
 * @brief Server access credentials transported by a registration token
 *
 * Immutable once created. Create() enforces the payload invariants:
 * - every string field is non-empty
 * - ssh_port is in 1..65535
 * - public_key is a single line
 * - generated_at_utc is `YYYY-MM-DDTHH:MM:SSZ`
 *
 * private_key_pem keeps its line breaks verbatim.
 */
class CredentialBundle {
public:
    [[nodiscard]] static Result<CredentialBundle, TokenFailure> Create(
        std::string hostname,
        uint32_t ssh_port,
        std::string ssh_username,
        std::string public_key,
        std::string private_key_pem,
        std::string generated_at_utc);

    [[nodiscard]] const std::string& Hostname() const noexcept { return hostname_; }
    [[nodiscard]] uint16_t SshPort() const noexcept { return ssh_port_; }
    [[nodiscard]] const std::string& SshUsername() const noexcept { return ssh_username_; }
    [[nodiscard]] const std::string& PublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const std::string& PrivateKeyPem() const noexcept { return private_key_pem_; }
    [[nodiscard]] const std::string& GeneratedAtUtc() const noexcept { return generated_at_utc_; }

    [[nodiscard]] UtcSeconds GeneratedAt() const noexcept { return generated_at_; }

    bool operator==(const CredentialBundle&) const = default;

private:
    CredentialBundle(
        std::string hostname,
        uint16_t ssh_port,
        std::string ssh_username,
        std::string public_key,
        std::string private_key_pem,
        std::string generated_at_utc,
        UtcSeconds generated_at);

    std::string hostname_;
    uint16_t ssh_port_;
    std::string ssh_username_;
    std::string public_key_;
    std::string private_key_pem_;
    std::string generated_at_utc_;
    UtcSeconds generated_at_;
};

} // namespace regtoken::models
