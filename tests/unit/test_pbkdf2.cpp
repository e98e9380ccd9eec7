#include <catch2/catch_test_macros.hpp>
#include "regtoken/crypto/pbkdf2.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/core/constants.hpp"
#include "helpers/hex.hpp"
using namespace regtoken;
using namespace regtoken::crypto;
using regtoken::test_helpers::Bytes;
using regtoken::test_helpers::FromHex;
TEST_CASE("PBKDF2-HMAC-SHA256 - Known answers", "[pbkdf2][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("password / salt, 1 iteration") {
        auto result = Pbkdf2::DeriveKeyBytes("password", Bytes("salt"), 1, 32);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex("120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b"));
    }
    SECTION("password / salt, 2 iterations") {
        auto result = Pbkdf2::DeriveKeyBytes("password", Bytes("salt"), 2, 32);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex("ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43"));
    }
    SECTION("Output longer than one hash block") {
        auto result = Pbkdf2::DeriveKeyBytes("passwd", Bytes("salt"), 1, 48);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex(
            "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc"
            "49ca9cccf179b645991664b39d77ef31"));
    }
    SECTION("Token parameters: hex passphrase, 8-byte salt, 100000 iterations") {
        const std::string passphrase =
            "0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef";
        auto result = Pbkdf2::DeriveKeyBytes(
            passphrase, FromHex("0001020304050607"),
            Constants::PBKDF2_ITERATIONS, Constants::DERIVED_KEY_MATERIAL_SIZE);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex(
            "fc4b3bc07d0f154852c4e71ea843dadb6df8602acc37c162a7ae8be00607ab04"
            "2de882fc8f245fa40cfd437d545b44db"));
    }
}
TEST_CASE("PBKDF2-HMAC-SHA256 - Parameter validation", "[pbkdf2][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Zero iterations rejected") {
        auto result = Pbkdf2::DeriveKeyBytes("password", Bytes("salt"), 0, 32);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
    SECTION("Zero-length output rejected") {
        auto result = Pbkdf2::DeriveKeyBytes("password", Bytes("salt"), 1, 0);
        REQUIRE(result.IsErr());
    }
    SECTION("Oversized output rejected") {
        auto result = Pbkdf2::DeriveKeyBytes("password", Bytes("salt"), 1, Pbkdf2::MAX_OUTPUT_LEN + 1);
        REQUIRE(result.IsErr());
    }
    SECTION("Different salts give different keys") {
        auto a = Pbkdf2::DeriveKeyBytes("password", Bytes("salt-one"), 1, 32);
        auto b = Pbkdf2::DeriveKeyBytes("password", Bytes("salt-two"), 1, 32);
        REQUIRE(a.Unwrap() != b.Unwrap());
    }
}
