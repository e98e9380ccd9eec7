#include <catch2/catch_test_macros.hpp>
#include "regtoken/crypto/salted_envelope.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/encoding/base64.hpp"
#include "regtoken/core/constants.hpp"
#include "helpers/hex.hpp"
#include <string>
using namespace regtoken;
using namespace regtoken::crypto;
using regtoken::encoding::Base64;
using regtoken::test_helpers::Bytes;
using regtoken::test_helpers::FromHex;
namespace {
    const std::string kPassphrase = "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";
    constexpr const char* kKnownEnvelope = "U2FsdGVkX18AAQIDBAUGB6UR+t/pTnDVrhB9DdZAkqA=";
}
TEST_CASE("SaltedEnvelope - OpenSSL enc compatibility", "[envelope][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Fixed salt reproduces openssl enc -pbkdf2 output") {
        auto result = SaltedEnvelope::SealWithSalt(Bytes("registration"), kPassphrase, FromHex("0001020304050607"));
        REQUIRE(result.IsOk());
        REQUIRE(Base64::Encode(result.Unwrap()) == kKnownEnvelope);
    }
    SECTION("Opens an envelope written by openssl enc") {
        auto envelope = Base64::Decode(kKnownEnvelope);
        REQUIRE(envelope.has_value());
        auto opened = SaltedEnvelope::Open(*envelope, kPassphrase);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == Bytes("registration"));
    }
    SECTION("Header layout") {
        auto result = SaltedEnvelope::SealWithSalt(Bytes("x"), kPassphrase, FromHex("a1a2a3a4a5a6a7a8"));
        REQUIRE(result.IsOk());
        const auto& envelope = result.Unwrap();
        REQUIRE(envelope.size() == SaltedEnvelope::HEADER_SIZE + Constants::AES_BLOCK_SIZE);
        REQUIRE(std::string(envelope.begin(), envelope.begin() + 8) == "Salted__");
        REQUIRE(std::vector<uint8_t>(envelope.begin() + 8, envelope.begin() + 16) == FromHex("a1a2a3a4a5a6a7a8"));
    }
}
TEST_CASE("SaltedEnvelope - Random salt", "[envelope][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto plaintext = Bytes("{\"hostname\":\"10.0.0.5\"}");
    auto first = SaltedEnvelope::Seal(plaintext, kPassphrase);
    auto second = SaltedEnvelope::Seal(plaintext, kPassphrase);
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    SECTION("Each seal uses a fresh salt") {
        REQUIRE(first.Unwrap() != second.Unwrap());
    }
    SECTION("Both open to the same plaintext") {
        REQUIRE(SaltedEnvelope::Open(first.Unwrap(), kPassphrase).Unwrap() == plaintext);
        REQUIRE(SaltedEnvelope::Open(second.Unwrap(), kPassphrase).Unwrap() == plaintext);
    }
}
TEST_CASE("SaltedEnvelope - Open failures", "[envelope][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto known = Base64::Decode(kKnownEnvelope);
    REQUIRE(known.has_value());
    const auto envelope = *known;
    SECTION("Too short for header and one block") {
        std::vector<uint8_t> truncated(envelope.begin(), envelope.begin() + 16);
        auto result = SaltedEnvelope::Open(truncated, kPassphrase);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidEnvelope);
    }
    SECTION("Ciphertext not block aligned") {
        auto extended = envelope;
        extended.push_back(0x00);
        auto result = SaltedEnvelope::Open(extended, kPassphrase);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidEnvelope);
    }
    SECTION("Marker altered") {
        auto altered = envelope;
        altered[0] = 'X';
        auto result = SaltedEnvelope::Open(altered, kPassphrase);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::MarkerMismatch);
    }
    SECTION("Wrong passphrase") {
        std::string wrong = kPassphrase;
        wrong[0] = '1';
        auto result = SaltedEnvelope::Open(envelope, wrong);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::Decrypt);
    }
    SECTION("Salt of the wrong size rejected when sealing") {
        auto result = SaltedEnvelope::SealWithSalt(Bytes("x"), kPassphrase, FromHex("00010203"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
}
