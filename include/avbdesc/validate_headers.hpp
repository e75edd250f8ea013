#pragma once

#include "avbdesc/config.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace avbdesc {

// ============================================================================
// Descriptor header validators.
//
// One validate-and-byteswap function per header kind. Each takes the header's
// wire bytes (big-endian, exactly the wire size, enforced by the span extent)
// and produces the host-order header.
//
// Invariants enforced:
// 1. num_bytes_following is a multiple of WireLayout::kDescriptorAlignment.
// 2. Fixed payload + all declared sub-field lengths <= num_bytes_following,
//    computed with overflow-checked 64-bit addition.
//
// Contract:
// - Never allocates, never throws
// - On false, `out` holds unspecified field values and must not be used
// - Does not interpret the tag (dispatch has already done so)
// ============================================================================

// Generic header shared by every descriptor kind
struct DescriptorHeader {
    std::uint64_t tag = 0;
    std::uint64_t num_bytes_following = 0;
};

struct PropertyDescriptorHeader {
    DescriptorHeader parent;
    std::uint64_t key_num_bytes = 0;
    std::uint64_t value_num_bytes = 0;
};

// hash_algorithm is not decoded here: it is a byte string, identical in wire
// and host order, and is read from the raw header at kHashAlgorithmOffset.
struct HashtreeDescriptorHeader {
    static constexpr std::size_t kHashAlgorithmOffset = 72;

    DescriptorHeader parent;
    std::uint32_t dm_verity_version = 0;
    std::uint64_t image_size = 0;
    std::uint64_t tree_offset = 0;
    std::uint64_t tree_size = 0;
    std::uint32_t data_block_size = 0;
    std::uint32_t hash_block_size = 0;
    std::uint32_t fec_num_roots = 0;
    std::uint64_t fec_offset = 0;
    std::uint64_t fec_size = 0;
    std::uint32_t partition_name_len = 0;
    std::uint32_t salt_len = 0;
    std::uint32_t root_digest_len = 0;
    std::uint32_t flags = 0;
};

struct HashDescriptorHeader {
    static constexpr std::size_t kHashAlgorithmOffset = 24;

    DescriptorHeader parent;
    std::uint64_t image_size = 0;
    std::uint32_t partition_name_len = 0;
    std::uint32_t salt_len = 0;
    std::uint32_t digest_len = 0;
    std::uint32_t flags = 0;
};

struct KernelCmdlineDescriptorHeader {
    DescriptorHeader parent;
    std::uint32_t flags = 0;
    std::uint32_t kernel_cmdline_length = 0;
};

struct ChainPartitionDescriptorHeader {
    DescriptorHeader parent;
    std::uint32_t rollback_index_location = 0;
    std::uint32_t partition_name_len = 0;
    std::uint32_t public_key_len = 0;
    std::uint32_t flags = 0;
};

bool validate_descriptor_header(
    std::span<const std::byte, WireLayout::kGenericHeaderBytes> raw,
    DescriptorHeader& out
) noexcept;

bool validate_property_header(
    std::span<const std::byte, WireLayout::kPropertyHeaderBytes> raw,
    PropertyDescriptorHeader& out
) noexcept;

bool validate_hashtree_header(
    std::span<const std::byte, WireLayout::kHashtreeHeaderBytes> raw,
    HashtreeDescriptorHeader& out
) noexcept;

bool validate_hash_header(
    std::span<const std::byte, WireLayout::kHashHeaderBytes> raw,
    HashDescriptorHeader& out
) noexcept;

bool validate_kernel_cmdline_header(
    std::span<const std::byte, WireLayout::kKernelCmdlineHeaderBytes> raw,
    KernelCmdlineDescriptorHeader& out
) noexcept;

bool validate_chain_partition_header(
    std::span<const std::byte, WireLayout::kChainPartitionHeaderBytes> raw,
    ChainPartitionDescriptorHeader& out
) noexcept;

}  // namespace avbdesc
