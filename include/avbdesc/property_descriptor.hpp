#pragma once

#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <span>
#include <string_view>

namespace avbdesc {

// Key/value property (views into original input, no allocation).
// The value is arbitrary bytes; its NUL terminator is not part of the view.
struct PropertyDescriptor {
    std::string_view key;
    std::span<const std::byte> value;

    friend bool operator==(const PropertyDescriptor& a, const PropertyDescriptor& b) noexcept;
};

// Parse one property descriptor.
//
// Body layout: key, NUL, value, NUL.
//
// Contract:
// - InvalidText if the key is not UTF-8 or either terminator is not NUL
// - Otherwise same contract as parse_hashtree_descriptor()
DescriptorResult<PropertyDescriptor> parse_property_descriptor(std::span<const std::byte> bytes) noexcept;

}  // namespace avbdesc
