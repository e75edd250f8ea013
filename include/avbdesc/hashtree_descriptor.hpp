#pragma once

#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace avbdesc {

// Hashtree descriptor flag bits. Carried opaquely; not interpreted here.
struct HashtreeDescriptorFlags {
    static constexpr std::uint32_t kDoNotUseAb = 1u << 0;
    static constexpr std::uint32_t kCheckAtMostOnce = 1u << 1;

    std::uint32_t bits = 0;

    constexpr bool has(std::uint32_t flag) const noexcept { return (bits & flag) == flag; }
    friend constexpr bool operator==(HashtreeDescriptorFlags, HashtreeDescriptorFlags) = default;
};

// dm-verity hashtree descriptor (views into original input, no allocation).
struct HashtreeDescriptor {
    std::uint32_t dm_verity_version;
    std::uint64_t image_size;               // hashed image size in bytes
    std::uint64_t tree_offset;              // offset of the hash tree root block
    std::uint64_t tree_size;
    std::uint32_t data_block_size;
    std::uint32_t hash_block_size;
    std::uint32_t fec_num_roots;            // 0 if the image carries no FEC data
    std::uint64_t fec_offset;
    std::uint64_t fec_size;
    std::string_view hash_algorithm;        // e.g. "sha1", "sha256"
    HashtreeDescriptorFlags flags;
    std::string_view partition_name;
    std::span<const std::byte> salt;
    std::span<const std::byte> root_digest;

    friend bool operator==(const HashtreeDescriptor& a, const HashtreeDescriptor& b) noexcept;
};

// Parse one hashtree descriptor.
//
// Precondition: bytes hold the descriptor (header + body; trailing padding
// may be absent), in raw big-endian format, starting at its tag. Bytes past
// the declared extent are ignored.
//
// Body layout: partition name, salt, root digest (packed, in that order).
//
// Contract:
// - Never allocates, never throws
// - All-or-nothing: either the full view or a DescriptorError
// - Returns views into the original input (caller must keep input alive)
DescriptorResult<HashtreeDescriptor> parse_hashtree_descriptor(std::span<const std::byte> bytes) noexcept;

}  // namespace avbdesc
