#include "avbdesc/text.hpp"

#include <cstdint>

namespace avbdesc {

namespace {

std::string_view as_chars(std::span<const std::byte> bytes) noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

bool is_continuation(std::uint8_t c) noexcept {
    return (c & 0xC0) == 0x80;
}

}  // namespace

bool is_valid_utf8(std::span<const std::byte> bytes) noexcept {
    std::size_t i = 0;
    const std::size_t n = bytes.size();

    while (i < n) {
        const auto c = std::to_integer<std::uint8_t>(bytes[i]);

        // ASCII
        if (c < 0x80) {
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte.
        // Narrowing the second byte rejects overlongs, surrogates and > U+10FFFF.
        std::size_t len = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            return false;  // 0x80..0xC1 lead byte or 0xF5..0xFF
        }

        if (n - i < len) {
            return false;  // truncated sequence
        }

        const auto c1 = std::to_integer<std::uint8_t>(bytes[i + 1]);
        if (c1 < lo || c1 > hi) {
            return false;
        }
        for (std::size_t k = 2; k < len; ++k) {
            if (!is_continuation(std::to_integer<std::uint8_t>(bytes[i + k]))) {
                return false;
            }
        }

        i += len;
    }

    return true;
}

DescriptorResult<std::string_view> decode_utf8(std::span<const std::byte> bytes) noexcept {
    if (!is_valid_utf8(bytes)) {
        return DescriptorError::InvalidText;
    }
    return as_chars(bytes);
}

DescriptorResult<std::string_view> decode_nul_terminated(std::span<const std::byte> field) noexcept {
    for (std::size_t i = 0; i < field.size(); ++i) {
        if (field[i] == std::byte{0}) {
            return decode_utf8(field.first(i));
        }
    }
    // Field fills its fixed width without a terminator
    return DescriptorError::InvalidText;
}

}  // namespace avbdesc
