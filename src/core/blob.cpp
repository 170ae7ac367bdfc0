/// @file blob.cpp
/// @brief Base64 text form for opaque payloads

#include <convoy/core/blob.hpp>

namespace convoy_core {

namespace {

constexpr const char* ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string base64_encode(const Blob& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16)
                        | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                        | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(ALPHABET[n & 0x3F]);
    }

    std::size_t rest = data.size() - i;
    if (rest == 1) {
        std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16)
                        | (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::optional<Blob> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    Blob out;
    out.reserve((text.size() / 4) * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        bool last = i + 4 == text.size();
        std::uint32_t n = 0;
        int padding = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=') {
                // Padding only in the final quad, only in the last two positions
                if (!last || j < 2) return std::nullopt;
                ++padding;
                n <<= 6;
                continue;
            }
            if (padding > 0) return std::nullopt;
            int v = decode_char(c);
            if (v < 0) return std::nullopt;
            n = (n << 6) | static_cast<std::uint32_t>(v);
        }

        // Bits below the last kept byte must be zero so every payload has one text form
        if ((padding == 2 && (n & 0xFFFF) != 0) || (padding == 1 && (n & 0xFF) != 0)) {
            return std::nullopt;
        }

        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }

    return out;
}

} // namespace convoy_core
