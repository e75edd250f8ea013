#include "avbdesc/validate_headers.hpp"

#include "avbdesc/byte_order.hpp"

namespace avbdesc {

namespace {

// Fixed bytes a kind adds after the generic header
template <std::size_t WireSize>
constexpr std::uint64_t fixed_payload_bytes() noexcept {
    static_assert(WireSize >= WireLayout::kGenericHeaderBytes);
    return WireSize - WireLayout::kGenericHeaderBytes;
}

// Every kind header starts with the generic one
template <std::size_t WireSize>
bool validate_parent(std::span<const std::byte, WireSize> raw, DescriptorHeader& out) noexcept {
    return validate_descriptor_header(raw.template first<WireLayout::kGenericHeaderBytes>(), out);
}

}  // namespace

bool validate_descriptor_header(
    std::span<const std::byte, WireLayout::kGenericHeaderBytes> raw,
    DescriptorHeader& out
) noexcept {
    out.tag = load_be64(raw, 0);
    out.num_bytes_following = load_be64(raw, 8);

    if (out.num_bytes_following % WireLayout::kDescriptorAlignment != 0) {
        return false;
    }
    return true;
}

bool validate_property_header(
    std::span<const std::byte, WireLayout::kPropertyHeaderBytes> raw,
    PropertyDescriptorHeader& out
) noexcept {
    if (!validate_parent(raw, out.parent)) {
        return false;
    }

    out.key_num_bytes = load_be64(raw, 16);
    out.value_num_bytes = load_be64(raw, 24);

    // key + NUL + value + NUL
    std::uint64_t expected = fixed_payload_bytes<WireLayout::kPropertyHeaderBytes>();
    if (!checked_add(expected, out.key_num_bytes) ||
        !checked_add(expected, 1) ||
        !checked_add(expected, out.value_num_bytes) ||
        !checked_add(expected, 1)) {
        return false;
    }

    return expected <= out.parent.num_bytes_following;
}

bool validate_hashtree_header(
    std::span<const std::byte, WireLayout::kHashtreeHeaderBytes> raw,
    HashtreeDescriptorHeader& out
) noexcept {
    if (!validate_parent(raw, out.parent)) {
        return false;
    }

    out.dm_verity_version = load_be32(raw, 16);
    out.image_size = load_be64(raw, 20);
    out.tree_offset = load_be64(raw, 28);
    out.tree_size = load_be64(raw, 36);
    out.data_block_size = load_be32(raw, 44);
    out.hash_block_size = load_be32(raw, 48);
    out.fec_num_roots = load_be32(raw, 52);
    out.fec_offset = load_be64(raw, 56);
    out.fec_size = load_be64(raw, 64);
    // 72: hash_algorithm[32]
    out.partition_name_len = load_be32(raw, 104);
    out.salt_len = load_be32(raw, 108);
    out.root_digest_len = load_be32(raw, 112);
    out.flags = load_be32(raw, 116);

    std::uint64_t expected = fixed_payload_bytes<WireLayout::kHashtreeHeaderBytes>();
    if (!checked_add(expected, out.partition_name_len) ||
        !checked_add(expected, out.salt_len) ||
        !checked_add(expected, out.root_digest_len)) {
        return false;
    }

    return expected <= out.parent.num_bytes_following;
}

bool validate_hash_header(
    std::span<const std::byte, WireLayout::kHashHeaderBytes> raw,
    HashDescriptorHeader& out
) noexcept {
    if (!validate_parent(raw, out.parent)) {
        return false;
    }

    out.image_size = load_be64(raw, 16);
    // 24: hash_algorithm[32]
    out.partition_name_len = load_be32(raw, 56);
    out.salt_len = load_be32(raw, 60);
    out.digest_len = load_be32(raw, 64);
    out.flags = load_be32(raw, 68);

    std::uint64_t expected = fixed_payload_bytes<WireLayout::kHashHeaderBytes>();
    if (!checked_add(expected, out.partition_name_len) ||
        !checked_add(expected, out.salt_len) ||
        !checked_add(expected, out.digest_len)) {
        return false;
    }

    return expected <= out.parent.num_bytes_following;
}

bool validate_kernel_cmdline_header(
    std::span<const std::byte, WireLayout::kKernelCmdlineHeaderBytes> raw,
    KernelCmdlineDescriptorHeader& out
) noexcept {
    if (!validate_parent(raw, out.parent)) {
        return false;
    }

    out.flags = load_be32(raw, 16);
    out.kernel_cmdline_length = load_be32(raw, 20);

    std::uint64_t expected = fixed_payload_bytes<WireLayout::kKernelCmdlineHeaderBytes>();
    if (!checked_add(expected, out.kernel_cmdline_length)) {
        return false;
    }

    return expected <= out.parent.num_bytes_following;
}

bool validate_chain_partition_header(
    std::span<const std::byte, WireLayout::kChainPartitionHeaderBytes> raw,
    ChainPartitionDescriptorHeader& out
) noexcept {
    if (!validate_parent(raw, out.parent)) {
        return false;
    }

    out.rollback_index_location = load_be32(raw, 16);
    out.partition_name_len = load_be32(raw, 20);
    out.public_key_len = load_be32(raw, 24);
    out.flags = load_be32(raw, 28);

    std::uint64_t expected = fixed_payload_bytes<WireLayout::kChainPartitionHeaderBytes>();
    if (!checked_add(expected, out.partition_name_len) ||
        !checked_add(expected, out.public_key_len)) {
        return false;
    }

    return expected <= out.parent.num_bytes_following;
}

}  // namespace avbdesc
