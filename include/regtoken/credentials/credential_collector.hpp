#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/core/option.hpp"
#include "regtoken/models/credential_bundle.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace regtoken::credentials {

struct CollectionOptions {
    Option<std::string> hostname;
    Option<uint16_t> ssh_port;
    Option<std::string> ssh_username;
    /// Append the new public key to authorized_keys so the server accepts it.
    bool install_authorized_key = true;
    /// Overrides ~/.ssh/authorized_keys; mainly for tests.
    Option<std::filesystem::path> authorized_keys_path;
};

struct CollectedCredentials {
    models::CredentialBundle bundle;
    std::string fingerprint;
    Option<std::filesystem::path> installed_to;
};

/**
 * @brief Gathers the values a registration token carries for this machine
 *
 * Host: first non-loopback IPv4 address, else the host name.
 * Port: SSH_PORT from the environment, else 22.
 * User: login name of the effective uid.
 * A fresh Ed25519 key pair is generated for every call; its comment is
 * `user@host name`.
 */
class CredentialCollector {
public:
    [[nodiscard]] static Result<CollectedCredentials, CredentialFailure> Collect(
        const CollectionOptions& options = {});

    [[nodiscard]] static Result<std::string, CredentialFailure> DetectHostAddress();
    [[nodiscard]] static Result<std::string, CredentialFailure> DetectUsername();
    [[nodiscard]] static Result<uint16_t, CredentialFailure> DetectSshPort();

    /// Decimal port in 1..65535.
    [[nodiscard]] static Result<uint16_t, CredentialFailure> ParsePort(std::string_view text);

    /// Append `public_key_line` to the file, creating its directory with mode 0700
    /// and setting the file to 0600.
    [[nodiscard]] static Result<Unit, CredentialFailure> InstallAuthorizedKey(
        const std::filesystem::path& authorized_keys,
        std::string_view public_key_line);

    [[nodiscard]] static Result<std::filesystem::path, CredentialFailure> DefaultAuthorizedKeysPath();

    [[nodiscard]] static std::string CurrentUtcTimestamp();

private:
    CredentialCollector() = delete;
};

} // namespace regtoken::credentials
