#pragma once

#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include "regtoken/core/constants.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace regtoken::codec {

/**
 * @brief Four-character trailer naming the splice position
 *
 * `LETTER DIGIT = =` where LETTER is 'A'..'I' for tens 1..9 and DIGIT is the
 * ones place. Only positions 10..99 are representable.
 */
class PositionSuffix {
public:
    [[nodiscard]] static Result<std::string, TokenFailure> Encode(uint32_t position);

    /// Fails with MalformedToken for any suffix Encode() cannot produce.
    [[nodiscard]] static Result<uint32_t, TokenFailure> Decode(std::string_view suffix);

private:
    PositionSuffix() = delete;
};

/**
 * @brief A token split into its regions
 *
 *   token = before + key_hex + after + suffix(position)
 *
 * where before + after is the unpadded base64 envelope and before holds the first
 * `position` characters of it (all of it when the envelope is shorter). Builder
 * and parser both go through this type, so Split(Splice(...).Assemble()) recovers
 * the same regions whenever the envelope is at least `position` characters long.
 * Split rejects the shorter shape because the key no longer starts at `position`.
 */
class TokenLayout {
public:
    /// Compose from an unpadded cipher string, a 64-char hex key and a position in 10..99.
    [[nodiscard]] static Result<TokenLayout, TokenFailure> Splice(
        std::string_view cipher_text,
        std::string_view key_hex,
        uint32_t position);

    /**
     * Decompose a token. Checks length bounds, the suffix and that the key lies
     * entirely inside the token; the cipher regions are not inspected.
     */
    [[nodiscard]] static Result<TokenLayout, TokenFailure> Split(
        std::string_view token,
        size_t max_token_length = TokenConstants::DEFAULT_MAX_TOKEN_LENGTH);

    [[nodiscard]] Result<std::string, TokenFailure> Assemble() const;

    /// before + after, still without base64 padding.
    [[nodiscard]] std::string CipherText() const;

    [[nodiscard]] const std::string& Before() const noexcept { return before_; }
    [[nodiscard]] const std::string& After() const noexcept { return after_; }
    [[nodiscard]] const std::string& KeyHex() const noexcept { return key_hex_; }
    [[nodiscard]] uint32_t Position() const noexcept { return position_; }

    /// Overwrite and release the key characters.
    void WipeKey() noexcept;

    /// Append '=' so the length is a multiple of 4. Length mod 4 == 1 is MalformedToken.
    [[nodiscard]] static Result<std::string, TokenFailure> RestoreBase64Padding(
        std::string_view unpadded);

    [[nodiscard]] static std::string_view StripBase64Padding(std::string_view padded) noexcept;

    TokenLayout(const TokenLayout&) = delete;
    TokenLayout& operator=(const TokenLayout&) = delete;
    TokenLayout(TokenLayout&&) noexcept = default;
    TokenLayout& operator=(TokenLayout&&) noexcept = default;
    ~TokenLayout();

private:
    TokenLayout(std::string before, std::string key_hex, std::string after, uint32_t position);

    std::string before_;
    std::string key_hex_;
    std::string after_;
    uint32_t position_;
};

} // namespace regtoken::codec
