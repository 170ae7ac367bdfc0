/// @file guid.cpp
/// @brief Guid parsing and formatting

#include <convoy/core/guid.hpp>

namespace convoy_core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr const char* HEX_DIGITS = "0123456789abcdef";

} // anonymous namespace

std::optional<Guid> Guid::parse(std::string_view text) {
    if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
        text = text.substr(1, text.size() - 2);
    }

    bool dashed = text.size() == 36;
    if (!dashed && text.size() != 32) {
        return std::nullopt;
    }

    Guid guid;
    std::size_t nibble = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (dashed && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (c != '-') return std::nullopt;
            continue;
        }
        int v = hex_value(c);
        if (v < 0) return std::nullopt;
        auto& byte = guid.bytes[nibble / 2];
        byte = static_cast<std::uint8_t>((nibble % 2 == 0) ? (v << 4) : (byte | v));
        ++nibble;
    }

    return guid;
}

std::string Guid::to_string() const {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX_DIGITS[bytes[i] >> 4]);
        out.push_back(HEX_DIGITS[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace convoy_core
