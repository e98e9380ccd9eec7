#include "regtoken/encoding/base64.hpp"
#include "regtoken/core/constants.hpp"

#include <sodium.h>

namespace regtoken::encoding {

namespace {
    std::string EncodeVariant(std::span<const uint8_t> data, const int variant) {
        // sodium_base64_ENCODED_LEN includes the terminating NUL.
        std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
        encoded.resize(encoded.size() - 1);
        return encoded;
    }
}

std::string Base64::Encode(std::span<const uint8_t> data) {
    return EncodeVariant(data, sodium_base64_VARIANT_ORIGINAL);
}

std::string Base64::EncodeUnpadded(std::span<const uint8_t> data) {
    return EncodeVariant(data, sodium_base64_VARIANT_ORIGINAL_NO_PADDING);
}

Option<std::vector<uint8_t>> Base64::Decode(std::string_view encoded) {
    if (encoded.size() % TokenConstants::BASE64_QUANTUM != 0) {
        return None<std::vector<uint8_t>>();
    }
    std::vector<uint8_t> decoded(encoded.size() / TokenConstants::BASE64_QUANTUM * 3);
    size_t decoded_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return None<std::vector<uint8_t>>();
    }
    if (end != encoded.data() + encoded.size()) {
        return None<std::vector<uint8_t>>();
    }
    decoded.resize(decoded_len);
    return Some(std::move(decoded));
}

std::string Hex::Encode(std::span<const uint8_t> data) {
    std::string encoded(data.size() * 2 + 1, '\0');
    sodium_bin2hex(encoded.data(), encoded.size(), data.data(), data.size());
    encoded.resize(data.size() * 2);
    return encoded;
}

} // namespace regtoken::encoding
