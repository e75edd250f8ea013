#pragma once

#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace avbdesc {

// Hash descriptor flag bits. Carried opaquely; not interpreted here.
struct HashDescriptorFlags {
    static constexpr std::uint32_t kDoNotUseAb = 1u << 0;

    std::uint32_t bits = 0;

    constexpr bool has(std::uint32_t flag) const noexcept { return (bits & flag) == flag; }
    friend constexpr bool operator==(HashDescriptorFlags, HashDescriptorFlags) = default;
};

// Whole-partition hash descriptor (views into original input, no allocation).
struct HashDescriptor {
    std::uint64_t image_size;
    std::string_view hash_algorithm;
    HashDescriptorFlags flags;
    std::string_view partition_name;
    std::span<const std::byte> salt;
    std::span<const std::byte> digest;

    friend bool operator==(const HashDescriptor& a, const HashDescriptor& b) noexcept;
};

// Parse one hash descriptor.
// Body layout: partition name, salt, digest.
// Same contract as parse_hashtree_descriptor().
DescriptorResult<HashDescriptor> parse_hash_descriptor(std::span<const std::byte> bytes) noexcept;

}  // namespace avbdesc
