#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

namespace avbdesc {

// Parse failure reasons (explicit enum, not attacker-controlled).
// Every failure is terminal for the descriptor being parsed.
enum class DescriptorError : std::uint8_t {
    InvalidHeader,        // shorter than the fixed header, or header rejected by its validator
    InvalidSize,          // declared lengths exceed the bytes available
    InvalidText,          // text field not UTF-8, or NUL terminator missing
    InvalidValue,         // 64-bit length does not fit in std::size_t
    InvalidContents,      // descriptor region framing is malformed
    TooManyDescriptors,   // region holds more than DescriptorLimits::kMaxDescriptors
};

// Result is either success (T) or failure (DescriptorError).
template <typename T>
using DescriptorResult = std::variant<T, DescriptorError>;

// Convert DescriptorError to string (for logging)
constexpr std::string_view descriptor_error_to_string(DescriptorError error) noexcept {
    switch (error) {
        case DescriptorError::InvalidHeader:      return "invalid_header";
        case DescriptorError::InvalidSize:        return "invalid_size";
        case DescriptorError::InvalidText:        return "invalid_text";
        case DescriptorError::InvalidValue:       return "invalid_value";
        case DescriptorError::InvalidContents:    return "invalid_contents";
        case DescriptorError::TooManyDescriptors: return "too_many_descriptors";
    }
    return "unknown";
}

}  // namespace avbdesc
