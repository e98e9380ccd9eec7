#include "regtoken/credentials/credential_collector.hpp"
#include "regtoken/credentials/openssh_key.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/debug/trace_logger.hpp"
#include "regtoken/core/constants.hpp"
#include "regtoken/core/format.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

namespace regtoken::credentials {
    using crypto::SodiumInterop;

    namespace {
        constexpr const char* SSH_PORT_VARIABLE = "SSH_PORT";
        constexpr const char* AUTHORIZED_KEYS_FILE = "authorized_keys";
        constexpr const char* SSH_DIRECTORY = ".ssh";

        struct IfAddrsDeleter {
            void operator()(ifaddrs* addresses) const noexcept {
                if (addresses) {
                    freeifaddrs(addresses);
                }
            }
        };
        using IfAddrsPtr = std::unique_ptr<ifaddrs, IfAddrsDeleter>;

        Option<std::string> FirstNonLoopbackIpv4() {
            ifaddrs* raw = nullptr;
            if (getifaddrs(&raw) != 0) {
                return None<std::string>();
            }
            const IfAddrsPtr addresses(raw);
            for (const ifaddrs* entry = addresses.get(); entry != nullptr; entry = entry->ifa_next) {
                if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET) {
                    continue;
                }
                const auto* inet = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
                if ((ntohl(inet->sin_addr.s_addr) >> 24) == IN_LOOPBACKNET) {
                    continue;
                }
                char text[INET_ADDRSTRLEN] = {};
                if (inet_ntop(AF_INET, &inet->sin_addr, text, sizeof(text)) != nullptr) {
                    return Some(std::string(text));
                }
            }
            return None<std::string>();
        }

        Result<std::string, CredentialFailure> LocalHostName() {
            char name[HOST_NAME_MAX + 1] = {};
            if (gethostname(name, sizeof(name)) != 0) {
                return Result<std::string, CredentialFailure>::Err(
                    CredentialFailure::HostDetection(
                        compat::format("gethostname failed: {}", std::strerror(errno))));
            }
            name[HOST_NAME_MAX] = '\0';
            if (name[0] == '\0') {
                return Result<std::string, CredentialFailure>::Err(
                    CredentialFailure::HostDetection("Host name is empty"));
            }
            return Result<std::string, CredentialFailure>::Ok(std::string(name));
        }

        Option<passwd> LookupEffectiveUser(std::vector<char>& storage) {
            long suggested = sysconf(_SC_GETPW_R_SIZE_MAX);
            storage.resize(suggested > 0 ? static_cast<size_t>(suggested) : 16384);
            passwd entry{};
            passwd* found = nullptr;
            if (getpwuid_r(geteuid(), &entry, storage.data(), storage.size(), &found) != 0 || found == nullptr) {
                return None<passwd>();
            }
            return Some(entry);
        }
    }

    Result<std::string, CredentialFailure> CredentialCollector::DetectHostAddress() {
        if (auto address = FirstNonLoopbackIpv4(); address.has_value()) {
            return Result<std::string, CredentialFailure>::Ok(std::move(*address));
        }
        return LocalHostName();
    }

    Result<std::string, CredentialFailure> CredentialCollector::DetectUsername() {
        std::vector<char> storage;
        const auto user = LookupEffectiveUser(storage);
        if (!user.has_value() || user->pw_name == nullptr || user->pw_name[0] == '\0') {
            return Result<std::string, CredentialFailure>::Err(
                CredentialFailure::HostDetection(
                    compat::format("No user name for effective uid {}", static_cast<unsigned>(geteuid()))));
        }
        return Result<std::string, CredentialFailure>::Ok(std::string(user->pw_name));
    }

    Result<uint16_t, CredentialFailure> CredentialCollector::ParsePort(const std::string_view text) {
        uint32_t port = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
        if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() ||
            port < PayloadConstants::MIN_SSH_PORT || port > PayloadConstants::MAX_SSH_PORT) {
            return Result<uint16_t, CredentialFailure>::Err(
                CredentialFailure::InvalidInput(
                    compat::format("'{}' is not a port in {}..{}",
                        text, PayloadConstants::MIN_SSH_PORT, PayloadConstants::MAX_SSH_PORT)));
        }
        return Result<uint16_t, CredentialFailure>::Ok(static_cast<uint16_t>(port));
    }

    Result<uint16_t, CredentialFailure> CredentialCollector::DetectSshPort() {
        const char* value = std::getenv(SSH_PORT_VARIABLE);
        if (value == nullptr || value[0] == '\0') {
            return Result<uint16_t, CredentialFailure>::Ok(PayloadConstants::DEFAULT_SSH_PORT);
        }
        return ParsePort(value);
    }

    Result<std::filesystem::path, CredentialFailure> CredentialCollector::DefaultAuthorizedKeysPath() {
        std::vector<char> storage;
        const auto user = LookupEffectiveUser(storage);
        std::filesystem::path home;
        if (user.has_value() && user->pw_dir != nullptr && user->pw_dir[0] != '\0') {
            home = user->pw_dir;
        } else if (const char* env_home = std::getenv("HOME"); env_home != nullptr && env_home[0] != '\0') {
            home = env_home;
        } else {
            return Result<std::filesystem::path, CredentialFailure>::Err(
                CredentialFailure::Io("Cannot determine the home directory"));
        }
        return Result<std::filesystem::path, CredentialFailure>::Ok(home / SSH_DIRECTORY / AUTHORIZED_KEYS_FILE);
    }

    Result<Unit, CredentialFailure> CredentialCollector::InstallAuthorizedKey(
        const std::filesystem::path& authorized_keys,
        const std::string_view public_key_line) {
        namespace fs = std::filesystem;

        if (public_key_line.empty() || public_key_line.find('\n') != std::string_view::npos) {
            return Result<Unit, CredentialFailure>::Err(
                CredentialFailure::InvalidInput("authorized_keys entry must be a single non-empty line"));
        }

        std::error_code ec;
        const auto directory = authorized_keys.parent_path();
        if (!directory.empty()) {
            fs::create_directories(directory, ec);
            if (ec) {
                return Result<Unit, CredentialFailure>::Err(
                    CredentialFailure::Io(
                        compat::format("Cannot create {}: {}", directory.string(), ec.message())));
            }
            fs::permissions(directory, fs::perms::owner_all, fs::perm_options::replace, ec);
            if (ec) {
                return Result<Unit, CredentialFailure>::Err(
                    CredentialFailure::Io(
                        compat::format("Cannot set permissions on {}: {}", directory.string(), ec.message())));
            }
        }

        {
            std::ofstream out(authorized_keys, std::ios::out | std::ios::app);
            if (!out) {
                return Result<Unit, CredentialFailure>::Err(
                    CredentialFailure::Io(compat::format("Cannot open {}", authorized_keys.string())));
            }
            out << public_key_line << '\n';
            out.flush();
            if (!out) {
                return Result<Unit, CredentialFailure>::Err(
                    CredentialFailure::Io(compat::format("Cannot write {}", authorized_keys.string())));
            }
        }

        fs::permissions(authorized_keys, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            return Result<Unit, CredentialFailure>::Err(
                CredentialFailure::Io(
                    compat::format("Cannot set permissions on {}: {}", authorized_keys.string(), ec.message())));
        }
        return Result<Unit, CredentialFailure>::Ok(unit);
    }

    std::string CredentialCollector::CurrentUtcTimestamp() {
        return models::FormatUtcTimestamp(
            std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()));
    }

    Result<CollectedCredentials, CredentialFailure> CredentialCollector::Collect(
        const CollectionOptions& options) {

        std::string hostname;
        if (options.hostname.has_value()) {
            hostname = *options.hostname;
        } else {
            auto detected = DetectHostAddress();
            if (detected.IsErr()) {
                return Result<CollectedCredentials, CredentialFailure>::Err(std::move(detected).UnwrapErr());
            }
            hostname = std::move(detected).Unwrap();
        }

        uint16_t port = PayloadConstants::DEFAULT_SSH_PORT;
        if (options.ssh_port.has_value()) {
            port = *options.ssh_port;
        } else {
            auto detected = DetectSshPort();
            if (detected.IsErr()) {
                return Result<CollectedCredentials, CredentialFailure>::Err(std::move(detected).UnwrapErr());
            }
            port = detected.Unwrap();
        }

        std::string username;
        if (options.ssh_username.has_value()) {
            username = *options.ssh_username;
        } else {
            auto detected = DetectUsername();
            if (detected.IsErr()) {
                return Result<CollectedCredentials, CredentialFailure>::Err(std::move(detected).UnwrapErr());
            }
            username = std::move(detected).Unwrap();
        }
        REGTOKEN_TRACE_VALUE(debug::Stage::Collect, "ssh_port", port);

        auto key_pair_result = SodiumInterop::GenerateEd25519KeyPair();
        if (key_pair_result.IsErr()) {
            return Result<CollectedCredentials, CredentialFailure>::Err(
                CredentialFailure::FromSodiumFailure(key_pair_result.UnwrapErr()));
        }
        auto [secret_key, public_key] = std::move(key_pair_result).Unwrap();

        std::string comment = username;
        if (auto host_name = LocalHostName(); host_name.IsOk()) {
            comment = compat::format("{}@{}", username, host_name.Unwrap());
        }

        auto public_line = OpenSshKey::PublicKeyLine(public_key, comment);
        auto private_pem = OpenSshKey::PrivateKeyPem(secret_key, public_key, comment);
        auto fingerprint = OpenSshKey::Fingerprint(public_key);
        {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(secret_key));
            (void) _wipe;
        }
        if (private_pem.IsErr()) {
            return Result<CollectedCredentials, CredentialFailure>::Err(std::move(private_pem).UnwrapErr());
        }
        std::string pem = std::move(private_pem).Unwrap();
        auto wipe_pem = [&pem] {
            auto _wipe = SodiumInterop::SecureWipe(pem);
            (void) _wipe;
        };
        if (public_line.IsErr()) {
            wipe_pem();
            return Result<CollectedCredentials, CredentialFailure>::Err(std::move(public_line).UnwrapErr());
        }
        if (fingerprint.IsErr()) {
            wipe_pem();
            return Result<CollectedCredentials, CredentialFailure>::Err(std::move(fingerprint).UnwrapErr());
        }

        // Create wipes the key it was handed when validation fails.
        auto bundle = models::CredentialBundle::Create(
            std::move(hostname),
            port,
            std::move(username),
            public_line.Unwrap(),
            std::move(pem),
            CurrentUtcTimestamp());
        if (bundle.IsErr()) {
            return Result<CollectedCredentials, CredentialFailure>::Err(
                CredentialFailure::FromTokenFailure(bundle.UnwrapErr()));
        }

        Option<std::filesystem::path> installed_to;
        if (options.install_authorized_key) {
            std::filesystem::path target;
            if (options.authorized_keys_path.has_value()) {
                target = *options.authorized_keys_path;
            } else {
                auto default_path = DefaultAuthorizedKeysPath();
                if (default_path.IsErr()) {
                    return Result<CollectedCredentials, CredentialFailure>::Err(
                        std::move(default_path).UnwrapErr());
                }
                target = std::move(default_path).Unwrap();
            }
            auto installed = InstallAuthorizedKey(target, public_line.Unwrap());
            if (installed.IsErr()) {
                return Result<CollectedCredentials, CredentialFailure>::Err(std::move(installed).UnwrapErr());
            }
            REGTOKEN_TRACE_MSG(debug::Stage::Collect, "public key installed");
            installed_to = std::move(target);
        }

        return Result<CollectedCredentials, CredentialFailure>::Ok(CollectedCredentials{
            std::move(bundle).Unwrap(),
            std::move(fingerprint).Unwrap(),
            std::move(installed_to)});
    }
}
