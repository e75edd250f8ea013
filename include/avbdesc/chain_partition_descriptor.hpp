#pragma once

#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace avbdesc {

// Chain partition descriptor flag bits. Carried opaquely.
struct ChainPartitionDescriptorFlags {
    static constexpr std::uint32_t kDoNotUseAb = 1u << 0;

    std::uint32_t bits = 0;

    constexpr bool has(std::uint32_t flag) const noexcept { return (bits & flag) == flag; }
    friend constexpr bool operator==(ChainPartitionDescriptorFlags, ChainPartitionDescriptorFlags) = default;
};

// Delegates verification of a partition to another signing key
// (views into original input, no allocation).
// The public key is carried as raw bytes and never checked here.
struct ChainPartitionDescriptor {
    std::uint32_t rollback_index_location;
    ChainPartitionDescriptorFlags flags;
    std::string_view partition_name;
    std::span<const std::byte> public_key;

    friend bool operator==(const ChainPartitionDescriptor& a, const ChainPartitionDescriptor& b) noexcept;
};

// Parse one chain partition descriptor.
// Body layout: partition name, public key.
DescriptorResult<ChainPartitionDescriptor> parse_chain_partition_descriptor(std::span<const std::byte> bytes) noexcept;

}  // namespace avbdesc
