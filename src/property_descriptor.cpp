#include "avbdesc/property_descriptor.hpp"

#include "avbdesc/parse_descriptor.hpp"
#include "avbdesc/text.hpp"

#include <variant>

namespace avbdesc {

namespace {

// Consume one terminator byte; it must be NUL.
DescriptorResult<std::span<const std::byte>> skip_terminator(std::span<const std::byte> bytes) noexcept {
    auto split = split_bytes(bytes, 1);
    if (const auto* error = std::get_if<DescriptorError>(&split)) {
        return *error;
    }
    const auto [terminator, rest] = std::get<SplitBytes>(split);
    if (terminator[0] != std::byte{0}) {
        return DescriptorError::InvalidText;
    }
    return rest;
}

}  // namespace

DescriptorResult<PropertyDescriptor> parse_property_descriptor(std::span<const std::byte> bytes) noexcept {
    auto parsed = parse_descriptor<PropertyDescriptorHeader>(bytes);
    if (const auto* error = std::get_if<DescriptorError>(&parsed)) {
        return *error;
    }
    const auto& descriptor = std::get<ParsedDescriptor<PropertyDescriptorHeader>>(parsed);
    const auto& header = descriptor.header;

    auto key_split = split_bytes(descriptor.body, header.key_num_bytes);
    if (const auto* error = std::get_if<DescriptorError>(&key_split)) {
        return *error;
    }
    const auto [key_bytes, after_key] = std::get<SplitBytes>(key_split);

    auto value_start = skip_terminator(after_key);
    if (const auto* error = std::get_if<DescriptorError>(&value_start)) {
        return *error;
    }

    auto value_split = split_bytes(std::get<std::span<const std::byte>>(value_start), header.value_num_bytes);
    if (const auto* error = std::get_if<DescriptorError>(&value_split)) {
        return *error;
    }
    const auto [value, after_value] = std::get<SplitBytes>(value_split);

    auto tail = skip_terminator(after_value);
    if (const auto* error = std::get_if<DescriptorError>(&tail)) {
        return *error;
    }

    auto key = decode_utf8(key_bytes);
    if (const auto* error = std::get_if<DescriptorError>(&key)) {
        return *error;
    }

    return PropertyDescriptor{ std::get<std::string_view>(key), value };
}

bool operator==(const PropertyDescriptor& a, const PropertyDescriptor& b) noexcept {
    return a.key == b.key && bytes_equal(a.value, b.value);
}

}  // namespace avbdesc
