/**
 * @file regtoken_cli.cpp
 * @brief Command line front end: generate a registration token for this server,
 *        or decode one.
 */

#include "regtoken/codec/envelope_builder.hpp"
#include "regtoken/codec/envelope_parser.hpp"
#include "regtoken/credentials/credential_collector.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/policy/expiry_policy.hpp"
#include "regtoken/models/utc_timestamp.hpp"
#include "regtoken/core/format.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <iterator>
#include <string_view>
#include <string>
#include <vector>

using namespace regtoken;
using regtoken::codec::EnvelopeBuilder;
using regtoken::codec::EnvelopeParser;
using regtoken::credentials::CollectionOptions;
using regtoken::credentials::CredentialCollector;
using regtoken::crypto::SodiumInterop;
using regtoken::policy::ExpiryPolicy;

namespace po = boost::program_options;

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    constexpr const char* RULE = "==========================================";
    constexpr const char* THIN_RULE = "------------------------------------------";

    std::string Trim(const std::string& text) {
        constexpr std::string_view whitespace = " \t\r\n";
        const auto first = text.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            return {};
        }
        const auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    void PrintUsage(const po::options_description& options) {
        std::cerr << "Usage:\n"
                  << "  regtoken generate [--host H] [--port P] [--user U] [--no-install-authorized-key]\n"
                  << "  regtoken decode [TOKEN]   (reads the token from stdin when omitted)\n\n"
                  << options << std::endl;
    }

    int RunGenerate(const po::variables_map& vm) {
        CollectionOptions options;
        if (vm.count("host")) {
            options.hostname = vm["host"].as<std::string>();
        }
        if (vm.count("port")) {
            auto port = CredentialCollector::ParsePort(vm["port"].as<std::string>());
            if (port.IsErr()) {
                std::cerr << "Error: " << port.UnwrapErr().message << std::endl;
                return EXIT_USAGE;
            }
            options.ssh_port = port.Unwrap();
        }
        if (vm.count("user")) {
            options.ssh_username = vm["user"].as<std::string>();
        }
        options.install_authorized_key = vm.count("no-install-authorized-key") == 0;

        auto collected_result = CredentialCollector::Collect(options);
        if (collected_result.IsErr()) {
            std::cerr << "Error: " << collected_result.UnwrapErr().message << std::endl;
            return EXIT_FAILED;
        }
        const auto& collected = collected_result.Unwrap();
        const auto& bundle = collected.bundle;

        std::cout << compat::format("Detected: {}@{}:{}", bundle.SshUsername(), bundle.Hostname(), bundle.SshPort())
                  << std::endl;
        std::cout << "SSH keypair generated (Ed25519)." << std::endl;
        if (collected.installed_to.has_value()) {
            std::cout << "Public key installed in " << collected.installed_to->string() << std::endl;
        }

        auto token = EnvelopeBuilder::Build(bundle);
        if (token.IsErr()) {
            std::cerr << "Error: " << ToString(token.UnwrapErr().type) << ": "
                      << token.UnwrapErr().message << std::endl;
            return EXIT_FAILED;
        }

        std::cout << "\n" << RULE << "\n"
                  << "  SERVER REGISTRATION TOKEN\n"
                  << RULE << "\n\n"
                  << "Copy this token and paste it into the registration form:\n\n"
                  << token.Unwrap() << "\n\n"
                  << THIN_RULE << "\n"
                  << compat::format("Server:      {}:{}\n", bundle.Hostname(), bundle.SshPort())
                  << compat::format("User:        {}\n", bundle.SshUsername())
                  << compat::format("Fingerprint: {}\n", collected.fingerprint)
                  << "Expires:     15 minutes from generation\n"
                  << RULE << std::endl;
        return EXIT_OK;
    }

    int RunDecode(const po::variables_map& vm) {
        std::string raw;
        if (vm.count("token")) {
            raw = vm["token"].as<std::string>();
        } else {
            raw.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        const std::string token = Trim(raw);

        auto bundle_result = EnvelopeParser::Parse(token);
        if (bundle_result.IsErr()) {
            const auto& failure = bundle_result.UnwrapErr();
            std::cerr << "Error: " << ToString(failure.type) << ": " << failure.message << std::endl;
            return EXIT_FAILED;
        }
        const auto& bundle = bundle_result.Unwrap();

        const ExpiryPolicy policy;
        const auto freshness = policy.Evaluate(bundle);

        std::cout << compat::format("Server:      {}:{}\n", bundle.Hostname(), bundle.SshPort())
                  << compat::format("User:        {}\n", bundle.SshUsername())
                  << compat::format("Public key:  {}\n", bundle.PublicKey())
                  << compat::format("Generated:   {}\n", bundle.GeneratedAtUtc())
                  << compat::format("Expires:     {} ({})\n",
                         models::FormatUtcTimestamp(policy.ExpiresAt(bundle)),
                         policy::ToString(freshness))
                  << "Private key:\n"
                  << bundle.PrivateKeyPem();
        if (!bundle.PrivateKeyPem().empty() && bundle.PrivateKeyPem().back() != '\n') {
            std::cout << '\n';
        }
        std::cout.flush();
        return EXIT_OK;
    }
}

int main(int argc, char* argv[]) {
    po::options_description visible("Options");
    visible.add_options()
        ("help,h", "Show this help")
        ("host", po::value<std::string>(), "Host name or address to advertise (generate)")
        ("port", po::value<std::string>(), "SSH port, defaults to $SSH_PORT or 22 (generate)")
        ("user", po::value<std::string>(), "SSH user, defaults to the current user (generate)")
        ("no-install-authorized-key", "Do not append the new public key to ~/.ssh/authorized_keys (generate)");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>())
        ("token", po::value<std::string>());

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("token", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        PrintUsage(visible);
        return EXIT_USAGE;
    }

    if (vm.count("help")) {
        PrintUsage(visible);
        return EXIT_OK;
    }
    if (!vm.count("command")) {
        PrintUsage(visible);
        return EXIT_USAGE;
    }

    const auto command = vm["command"].as<std::string>();
    const bool has_generate_options = vm.count("host") || vm.count("port") || vm.count("user") ||
                                      vm.count("no-install-authorized-key");

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Error: " << init.UnwrapErr().message << std::endl;
        return EXIT_FAILED;
    }

    if (command == "generate") {
        if (vm.count("token")) {
            std::cerr << "Error: generate takes no positional arguments\n\n";
            PrintUsage(visible);
            return EXIT_USAGE;
        }
        return RunGenerate(vm);
    }
    if (command == "decode") {
        if (has_generate_options) {
            std::cerr << "Error: --host, --port, --user and --no-install-authorized-key apply to generate only\n\n";
            PrintUsage(visible);
            return EXIT_USAGE;
        }
        return RunDecode(vm);
    }

    std::cerr << "Error: unknown command '" << command << "'\n\n";
    PrintUsage(visible);
    return EXIT_USAGE;
}
