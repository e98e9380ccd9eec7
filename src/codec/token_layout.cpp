#include "regtoken/codec/token_layout.hpp"
#include "regtoken/crypto/sodium_interop.hpp"
#include "regtoken/core/format.hpp"

#include <algorithm>

namespace regtoken::codec {
    namespace {
        constexpr size_t KEY_LENGTH = Constants::ONE_TIME_KEY_HEX_LENGTH;
        constexpr size_t SUFFIX_LENGTH = TokenConstants::POSITION_SUFFIX_LENGTH;

        bool IsSplicePosition(const uint32_t position) noexcept {
            return position >= TokenConstants::MIN_SPLICE_POSITION &&
                   position <= TokenConstants::MAX_SPLICE_POSITION;
        }
    }

    Result<std::string, TokenFailure> PositionSuffix::Encode(const uint32_t position) {
        if (!IsSplicePosition(position)) {
            return Result<std::string, TokenFailure>::Err(
                TokenFailure::InvalidInput(
                    compat::format("Splice position {} is outside {}..{}",
                        position,
                        TokenConstants::MIN_SPLICE_POSITION,
                        TokenConstants::MAX_SPLICE_POSITION)));
        }
        std::string suffix;
        suffix.reserve(SUFFIX_LENGTH);
        suffix.push_back(TokenConstants::POSITION_ALPHABET[position / TokenConstants::POSITION_RADIX]);
        suffix.push_back(static_cast<char>('0' + position % TokenConstants::POSITION_RADIX));
        suffix.append(TokenConstants::SUFFIX_TERMINATOR);
        return Result<std::string, TokenFailure>::Ok(std::move(suffix));
    }

    Result<uint32_t, TokenFailure> PositionSuffix::Decode(const std::string_view suffix) {
        if (suffix.size() != SUFFIX_LENGTH ||
            suffix.substr(2) != TokenConstants::SUFFIX_TERMINATOR) {
            return Result<uint32_t, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::BAD_SUFFIX_TERMINATOR)));
        }

        // Index 0 of the alphabet is a placeholder and never a valid tens digit.
        const auto tens = TokenConstants::POSITION_ALPHABET.find(suffix[0]);
        if (tens == std::string_view::npos || tens == 0) {
            return Result<uint32_t, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::BAD_POSITION_LETTER)));
        }
        if (suffix[1] < '0' || suffix[1] > '9') {
            return Result<uint32_t, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::BAD_POSITION_DIGIT)));
        }

        const auto position = static_cast<uint32_t>(
            tens * TokenConstants::POSITION_RADIX + static_cast<uint32_t>(suffix[1] - '0'));
        if (!IsSplicePosition(position)) {
            return Result<uint32_t, TokenFailure>::Err(
                TokenFailure::MalformedToken(
                    compat::format("Splice position {} is outside {}..{}",
                        position,
                        TokenConstants::MIN_SPLICE_POSITION,
                        TokenConstants::MAX_SPLICE_POSITION)));
        }
        return Result<uint32_t, TokenFailure>::Ok(position);
    }

    TokenLayout::TokenLayout(
        std::string before,
        std::string key_hex,
        std::string after,
        const uint32_t position)
        : before_(std::move(before))
        , key_hex_(std::move(key_hex))
        , after_(std::move(after))
        , position_(position) {}

    TokenLayout::~TokenLayout() {
        WipeKey();
    }

    Result<TokenLayout, TokenFailure> TokenLayout::Splice(
        const std::string_view cipher_text,
        const std::string_view key_hex,
        const uint32_t position) {

        if (key_hex.size() != KEY_LENGTH) {
            return Result<TokenLayout, TokenFailure>::Err(
                TokenFailure::InvalidInput(
                    compat::format("One-time key must be {} hex characters, got {}",
                        KEY_LENGTH, key_hex.size())));
        }
        if (!IsSplicePosition(position)) {
            return Result<TokenLayout, TokenFailure>::Err(
                TokenFailure::InvalidInput(
                    compat::format("Splice position {} is outside {}..{}",
                        position,
                        TokenConstants::MIN_SPLICE_POSITION,
                        TokenConstants::MAX_SPLICE_POSITION)));
        }

        // A cipher string shorter than the position keeps everything in `before`.
        const size_t split = std::min<size_t>(position, cipher_text.size());
        return Result<TokenLayout, TokenFailure>::Ok(TokenLayout(
            std::string(cipher_text.substr(0, split)),
            std::string(key_hex),
            std::string(cipher_text.substr(split)),
            position));
    }

    Result<TokenLayout, TokenFailure> TokenLayout::Split(
        const std::string_view token,
        const size_t max_token_length) {

        if (token.size() < TokenConstants::MIN_TOKEN_LENGTH) {
            return Result<TokenLayout, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::TOKEN_TOO_SHORT)));
        }
        if (token.size() > max_token_length) {
            return Result<TokenLayout, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::TOKEN_TOO_LONG)));
        }

        auto position_result = PositionSuffix::Decode(token.substr(token.size() - SUFFIX_LENGTH));
        if (position_result.IsErr()) {
            return Result<TokenLayout, TokenFailure>::Err(std::move(position_result).UnwrapErr());
        }
        const uint32_t position = position_result.Unwrap();

        const auto remainder = token.substr(0, token.size() - SUFFIX_LENGTH);
        if (remainder.size() < position + KEY_LENGTH) {
            return Result<TokenLayout, TokenFailure>::Err(
                TokenFailure::MalformedToken(std::string(ErrorMessages::KEY_TRUNCATED)));
        }

        return Result<TokenLayout, TokenFailure>::Ok(TokenLayout(
            std::string(remainder.substr(0, position)),
            std::string(remainder.substr(position, KEY_LENGTH)),
            std::string(remainder.substr(position + KEY_LENGTH)),
            position));
    }

    Result<std::string, TokenFailure> TokenLayout::Assemble() const {
        auto suffix = PositionSuffix::Encode(position_);
        if (suffix.IsErr()) {
            return suffix;
        }
        std::string token;
        token.reserve(before_.size() + key_hex_.size() + after_.size() + SUFFIX_LENGTH);
        token.append(before_);
        token.append(key_hex_);
        token.append(after_);
        token.append(suffix.Unwrap());
        return Result<std::string, TokenFailure>::Ok(std::move(token));
    }

    std::string TokenLayout::CipherText() const {
        std::string cipher_text;
        cipher_text.reserve(before_.size() + after_.size());
        cipher_text.append(before_);
        cipher_text.append(after_);
        return cipher_text;
    }

    void TokenLayout::WipeKey() noexcept {
        auto _wipe = crypto::SodiumInterop::SecureWipe(key_hex_);
        (void) _wipe;
    }

    Result<std::string, TokenFailure> TokenLayout::RestoreBase64Padding(const std::string_view unpadded) {
        std::string padded(unpadded);
        switch (unpadded.size() % TokenConstants::BASE64_QUANTUM) {
            case 0:
                break;
            case 2:
                padded.append(2, TokenConstants::BASE64_PAD);
                break;
            case 3:
                padded.append(1, TokenConstants::BASE64_PAD);
                break;
            default:
                return Result<std::string, TokenFailure>::Err(
                    TokenFailure::MalformedToken(std::string(ErrorMessages::BAD_BASE64_LENGTH)));
        }
        return Result<std::string, TokenFailure>::Ok(std::move(padded));
    }

    std::string_view TokenLayout::StripBase64Padding(std::string_view padded) noexcept {
        while (!padded.empty() && padded.back() == TokenConstants::BASE64_PAD) {
            padded.remove_suffix(1);
        }
        return padded;
    }
}
