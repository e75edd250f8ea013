#pragma once

#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <span>
#include <string_view>

namespace avbdesc {

// ============================================================================
// Text sub-field decoding.
//
// Descriptor text fields are UTF-8 without a byte-order mark. Validation is
// strict: overlong encodings, UTF-16 surrogates and code points above
// U+10FFFF are rejected.
//
// All functions return views into the input (caller must keep input alive).
// ============================================================================

// Returns true if bytes are well-formed UTF-8.
// CPU: O(n), single pass.
bool is_valid_utf8(std::span<const std::byte> bytes) noexcept;

// Decode a length-delimited text field.
// Returns InvalidText if bytes are not UTF-8.
DescriptorResult<std::string_view> decode_utf8(std::span<const std::byte> bytes) noexcept;

// Decode a fixed-width, NUL-terminated text field (e.g. hash_algorithm).
// The text ends at the first NUL; bytes after it are ignored.
// Returns InvalidText if no NUL occurs within the field or the text before
// it is not UTF-8.
DescriptorResult<std::string_view> decode_nul_terminated(std::span<const std::byte> field) noexcept;

}  // namespace avbdesc
