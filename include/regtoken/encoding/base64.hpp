#pragma once

#include "regtoken/core/option.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace regtoken::encoding {

/**
 * @brief Standard-alphabet base64 (RFC 4648 section 4) backed by libsodium
 *
 * Decoding is strict: it rejects characters outside the alphabet, misplaced
 * padding and non-zero trailing bits.
 */
class Base64 {
public:
    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

    /// Encode without trailing '=' characters.
    [[nodiscard]] static std::string EncodeUnpadded(std::span<const uint8_t> data);

    /// Decode padded input. None when the input is not valid base64.
    [[nodiscard]] static Option<std::vector<uint8_t>> Decode(std::string_view encoded);

private:
    Base64() = delete;
};

/**
 * @brief Lowercase hexadecimal encoding backed by libsodium
 */
class Hex {
public:
    [[nodiscard]] static std::string Encode(std::span<const uint8_t> data);

private:
    Hex() = delete;
};

} // namespace regtoken::encoding
