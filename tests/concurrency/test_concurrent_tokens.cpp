#include <catch2/catch_test_macros.hpp>
#include "regtoken/codec/envelope_builder.hpp"
#include "regtoken/codec/envelope_parser.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "helpers/bundle_fixtures.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace regtoken;
using namespace regtoken::codec;
using regtoken::crypto::SodiumInterop;
using regtoken::test_helpers::BundleFields;
using regtoken::test_helpers::MakeBundle;
using regtoken::test_helpers::SampleBundle;

TEST_CASE("Concurrency - Parallel token generation", "[concurrency][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("8 threads building 4 tokens each - all distinct and decodable") {
        constexpr int THREAD_COUNT = 8;
        constexpr int TOKENS_PER_THREAD = 4;

        const auto bundle = SampleBundle();
        std::unordered_set<std::string> token_set;
        std::mutex token_set_mutex;
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < TOKENS_PER_THREAD; ++i) {
                    auto token_result = EnvelopeBuilder::Build(bundle);
                    if (token_result.IsErr()) {
                        failures.fetch_add(1);
                        continue;
                    }
                    auto token = std::move(token_result).Unwrap();
                    auto decoded = EnvelopeParser::Parse(token);
                    if (decoded.IsErr() || !(decoded.Unwrap() == bundle)) {
                        failures.fetch_add(1);
                    }
                    std::lock_guard<std::mutex> lock(token_set_mutex);
                    token_set.insert(std::move(token));
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(token_set.size() == THREAD_COUNT * TOKENS_PER_THREAD);
    }
}

TEST_CASE("Concurrency - Cross-thread decoding", "[concurrency][codec]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Tokens built on one thread decode on others") {
        constexpr int THREAD_COUNT = 6;

        std::vector<std::string> tokens;
        std::vector<models::CredentialBundle> bundles;
        for (int t = 0; t < THREAD_COUNT; ++t) {
            BundleFields fields;
            fields.hostname = "node-" + std::to_string(t) + ".internal";
            fields.ssh_port = static_cast<uint32_t>(2200 + t);
            bundles.push_back(MakeBundle(fields).Unwrap());
            tokens.push_back(EnvelopeBuilder::Build(bundles.back()).Unwrap());
        }

        std::atomic<int> matches{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                const auto index = static_cast<size_t>((t + 1) % THREAD_COUNT);
                auto decoded = EnvelopeParser::Parse(tokens[index]);
                if (decoded.IsOk() && decoded.Unwrap() == bundles[index]) {
                    matches.fetch_add(1);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(matches.load() == THREAD_COUNT);
    }
}
