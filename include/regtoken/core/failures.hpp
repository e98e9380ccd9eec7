#pragma once
#include <string>
#include <string_view>
namespace regtoken {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    SecureWipeFailed,
    KeyGenerationFailed,
    InvalidOperation
};
enum class CryptoFailureType {
    InvalidInput,
    InvalidEnvelope,
    MarkerMismatch,
    DeriveKey,
    Encrypt,
    Decrypt,
    RandomSource
};
enum class TokenFailureType {
    Encoding,
    MalformedToken,
    Decryption,
    MalformedPayload,
    InvalidInput
};
enum class CredentialFailureType {
    KeyGeneration,
    HostDetection,
    Io,
    InvalidInput
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure KeyGenerationFailed(std::string msg) {
        return {SodiumFailureType::KeyGenerationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class CryptoFailure {
public:
    CryptoFailureType type;
    std::string message;
    CryptoFailure(const CryptoFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CryptoFailure InvalidInput(std::string msg) {
        return {CryptoFailureType::InvalidInput, std::move(msg)};
    }
    static CryptoFailure InvalidEnvelope(std::string msg) {
        return {CryptoFailureType::InvalidEnvelope, std::move(msg)};
    }
    static CryptoFailure MarkerMismatch(std::string msg) {
        return {CryptoFailureType::MarkerMismatch, std::move(msg)};
    }
    static CryptoFailure DeriveKey(std::string msg) {
        return {CryptoFailureType::DeriveKey, std::move(msg)};
    }
    static CryptoFailure Encrypt(std::string msg) {
        return {CryptoFailureType::Encrypt, std::move(msg)};
    }
    static CryptoFailure Decrypt(std::string msg) {
        return {CryptoFailureType::Decrypt, std::move(msg)};
    }
    static CryptoFailure RandomSource(std::string msg) {
        return {CryptoFailureType::RandomSource, std::move(msg)};
    }
    static CryptoFailure FromSodiumFailure(const SodiumFailure& sf) {
        return RandomSource(sf.message);
    }
};

/**
 * Failure reported by the token codec.
 *
 * Encoding, MalformedToken, Decryption and MalformedPayload are the four kinds a
 * caller must be able to tell apart. InvalidInput is raised when a credential
 * bundle or configuration value is rejected before any token work starts.
 * Messages never contain key material.
 */
class TokenFailure {
public:
    TokenFailureType type;
    std::string message;
    TokenFailure(const TokenFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static TokenFailure Encoding(std::string msg) {
        return {TokenFailureType::Encoding, std::move(msg)};
    }
    static TokenFailure MalformedToken(std::string msg) {
        return {TokenFailureType::MalformedToken, std::move(msg)};
    }
    static TokenFailure Decryption(std::string msg) {
        return {TokenFailureType::Decryption, std::move(msg)};
    }
    static TokenFailure MalformedPayload(std::string msg) {
        return {TokenFailureType::MalformedPayload, std::move(msg)};
    }
    static TokenFailure InvalidInput(std::string msg) {
        return {TokenFailureType::InvalidInput, std::move(msg)};
    }
    static TokenFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Encoding(sf.message);
    }
};
class CredentialFailure {
public:
    CredentialFailureType type;
    std::string message;
    CredentialFailure(const CredentialFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CredentialFailure KeyGeneration(std::string msg) {
        return {CredentialFailureType::KeyGeneration, std::move(msg)};
    }
    static CredentialFailure HostDetection(std::string msg) {
        return {CredentialFailureType::HostDetection, std::move(msg)};
    }
    static CredentialFailure Io(std::string msg) {
        return {CredentialFailureType::Io, std::move(msg)};
    }
    static CredentialFailure InvalidInput(std::string msg) {
        return {CredentialFailureType::InvalidInput, std::move(msg)};
    }
    static CredentialFailure FromSodiumFailure(const SodiumFailure& sf) {
        return KeyGeneration(sf.message);
    }
    static CredentialFailure FromTokenFailure(const TokenFailure& tf) {
        return InvalidInput(tf.message);
    }
};
[[nodiscard]] constexpr std::string_view ToString(const TokenFailureType type) noexcept {
    switch (type) {
        case TokenFailureType::Encoding: return "EncodingError";
        case TokenFailureType::MalformedToken: return "MalformedTokenError";
        case TokenFailureType::Decryption: return "DecryptionError";
        case TokenFailureType::MalformedPayload: return "MalformedPayloadError";
        case TokenFailureType::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}
}
