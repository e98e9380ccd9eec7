#include <catch2/catch_test_macros.hpp>
#include "regtoken/crypto/aes_cbc.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/core/constants.hpp"
#include "helpers/hex.hpp"
using namespace regtoken;
using namespace regtoken::crypto;
using regtoken::test_helpers::Bytes;
using regtoken::test_helpers::FromHex;
namespace {
    const auto kNistKey = FromHex("603deb1015ca71be2b73aef0857d77811f352c073b6108d72d9810a30914dff4");
    const auto kNistIv = FromHex("000102030405060708090a0b0c0d0e0f");
    const auto kNistPlaintext = FromHex(
        "6bc1bee22e409f96e93d7e117393172aae2d8a571e03ac9c9eb76fac45af8e51"
        "30c81c46a35ce411e5fbc1191a0a52eff69f2445df4f9b17ad2b417be66c3710");
    const auto kNistCiphertext = FromHex(
        "f58c4c04d6e5f1ba779eabfb5f7bfbd69cfc4e967edb808d679f777bc6702c7d"
        "39f23369a9d9bacfa530e26304231461b2eb05e2c39be9fcda6c19078c6a9d1b");
}
TEST_CASE("AES-256-CBC - SP 800-38A vectors with PKCS#7", "[aes_cbc][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Encrypt matches the published blocks plus one padding block") {
        auto result = AesCbc::Encrypt(kNistKey, kNistIv, kNistPlaintext);
        REQUIRE(result.IsOk());
        const auto& ciphertext = result.Unwrap();
        REQUIRE(ciphertext.size() == kNistPlaintext.size() + Constants::AES_BLOCK_SIZE);
        REQUIRE(std::vector<uint8_t>(ciphertext.begin(), ciphertext.begin() + 64) == kNistCiphertext);
        REQUIRE(std::vector<uint8_t>(ciphertext.begin() + 64, ciphertext.end()) ==
                FromHex("3f461796d6b0d6b2e0c2a72b4d80e644"));
    }
    SECTION("Single block") {
        std::vector<uint8_t> block(kNistPlaintext.begin(), kNistPlaintext.begin() + 16);
        auto result = AesCbc::Encrypt(kNistKey, kNistIv, block);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == 32);
        REQUIRE(std::vector<uint8_t>(result.Unwrap().begin(), result.Unwrap().begin() + 16) ==
                FromHex("f58c4c04d6e5f1ba779eabfb5f7bfbd6"));
    }
    SECTION("Decrypt round-trip") {
        auto encrypted = AesCbc::Encrypt(kNistKey, kNistIv, kNistPlaintext);
        auto decrypted = AesCbc::Decrypt(kNistKey, kNistIv, encrypted.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap() == kNistPlaintext);
    }
}
TEST_CASE("AES-256-CBC - Padding and input checks", "[aes_cbc][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(Constants::AES_KEY_SIZE, 0x11);
    const std::vector<uint8_t> iv(Constants::AES_CBC_IV_SIZE, 0x22);
    const auto plaintext = Bytes("hello, registration");
    SECTION("Matches openssl enc output") {
        auto result = AesCbc::Encrypt(key, iv, plaintext);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex("8ba70e86b4061072c61b14ee07c258a53945048bd45148190922db8709dade07"));
    }
    SECTION("Empty plaintext is one full padding block") {
        auto result = AesCbc::Encrypt(key, iv, std::vector<uint8_t>{});
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == Constants::AES_BLOCK_SIZE);
        auto decrypted = AesCbc::Decrypt(key, iv, result.Unwrap());
        REQUIRE(decrypted.IsOk());
        REQUIRE(decrypted.Unwrap().empty());
    }
    SECTION("Wrong key fails the padding check") {
        const std::vector<uint8_t> wrong_key(Constants::AES_KEY_SIZE, 0x12);
        auto result = AesCbc::Decrypt(wrong_key, iv,
            FromHex("8ba70e86b4061072c61b14ee07c258a53945048bd45148190922db8709dade07"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::Decrypt);
    }
    SECTION("Tampered final byte fails the padding check") {
        auto tampered = FromHex("8ba70e86b4061072c61b14ee07c258a53945048bd45148190922db8709dade07");
        tampered.back() ^= 0x01;
        auto result = AesCbc::Decrypt(key, iv, tampered);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::Decrypt);
    }
    SECTION("Ciphertext not block aligned") {
        auto result = AesCbc::Decrypt(key, iv, std::vector<uint8_t>(17, 0x00));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidEnvelope);
    }
    SECTION("Empty ciphertext") {
        auto result = AesCbc::Decrypt(key, iv, std::vector<uint8_t>{});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidEnvelope);
    }
    SECTION("Short key rejected") {
        auto result = AesCbc::Encrypt(std::vector<uint8_t>(16, 0x11), iv, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
    SECTION("Short IV rejected") {
        auto result = AesCbc::Decrypt(key, std::vector<uint8_t>(12, 0x22), std::vector<uint8_t>(16, 0x00));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CryptoFailureType::InvalidInput);
    }
}
