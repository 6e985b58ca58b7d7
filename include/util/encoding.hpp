#pragma once

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pv::util {

// Crockford Base32 (no I, L, O, U), safe for object keys and file names
static inline constexpr char kBase32Crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

enum class Case { Upper, Lower };

// thread-safe, idempotent
inline void ensure_sodium_init() {
    static const int init = [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

inline std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case = Case::Upper) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            const uint8_t idx = (buffer >> bits) & 0x1F;
            out.push_back(kBase32Crockford[idx]);
        }
    }
    if (bits > 0) {
        const uint8_t idx = (buffer << (5 - bits)) & 0x1F;
        out.push_back(kBase32Crockford[idx]);
    }
    if (out_case == Case::Lower)
        std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// `chars` symbols of secure randomness, 5 bits each
inline std::string random_b32(const size_t chars, const Case out_case = Case::Upper) {
    ensure_sodium_init();
    std::vector<uint8_t> buf((chars * 5 + 7) / 8);
    randombytes_buf(buf.data(), buf.size());
    auto out = b32_crockford_encode(buf.data(), buf.size(), out_case);
    out.resize(chars);
    return out;
}

inline std::string b64_encode(const uint8_t* data, const size_t len) {
    ensure_sodium_init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(), data, len, sodium_base64_VARIANT_ORIGINAL);

    result.resize(encoded_len - 1); // drop the terminator sodium writes
    return result;
}

inline std::string b64_encode(const std::vector<uint8_t>& data) { return b64_encode(data.data(), data.size()); }

inline std::vector<uint8_t> b64_decode(const std::string_view b64) {
    ensure_sodium_init();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.data(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
        throw std::runtime_error("Invalid base64 payload");
    decoded.resize(out_len);
    return decoded;
}

}
