#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anonproxy::base64 {

inline std::string encode(const uint8_t* data, size_t len) {
    static const char kChars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kChars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kChars[n & 0x3F] : '=';
    }
    return result;
}

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

/**
 * @brief Strict decode: padded standard alphabet only
 *
 * Returns nullopt on any character outside the alphabet, bad length or
 * misplaced padding, so that two different strings never decode to the
 * same bytes.
 */
inline std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    static constexpr uint8_t kInvalid = 0xFF;
    static const auto kTable = [] {
        struct Table { uint8_t v[256]; } t{};
        for (auto& b : t.v) b = kInvalid;
        const char* chars =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (uint8_t i = 0; i < 64; ++i) {
            t.v[static_cast<unsigned char>(chars[i])] = i;
        }
        return t;
    }();

    if (encoded.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (!encoded.empty() && encoded.back() == '=') ++padding;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ++padding;

    std::vector<uint8_t> result;
    result.reserve(3 * encoded.size() / 4);

    const size_t data_len = encoded.size() - padding;
    uint32_t buf = 0;
    int bits = 0;
    for (size_t i = 0; i < data_len; ++i) {
        const uint8_t val = kTable.v[static_cast<unsigned char>(encoded[i])];
        if (val == kInvalid) return std::nullopt;

        buf = (buf << 6) | val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    // Leftover bits must be zero for a canonical encoding
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) return std::nullopt;
    return result;
}

} // namespace anonproxy::base64
