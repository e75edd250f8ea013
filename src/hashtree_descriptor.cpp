#include "avbdesc/hashtree_descriptor.hpp"

#include "avbdesc/parse_descriptor.hpp"
#include "avbdesc/text.hpp"

#include <variant>

namespace avbdesc {

DescriptorResult<HashtreeDescriptor> parse_hashtree_descriptor(std::span<const std::byte> bytes) noexcept {
    auto parsed = parse_descriptor<HashtreeDescriptorHeader>(bytes);
    if (const auto* error = std::get_if<DescriptorError>(&parsed)) {
        return *error;
    }
    const auto& descriptor = std::get<ParsedDescriptor<HashtreeDescriptorHeader>>(parsed);
    const auto& header = descriptor.header;

    // Body: partition name + salt + root digest
    auto name_split = split_bytes(descriptor.body, header.partition_name_len);
    if (const auto* error = std::get_if<DescriptorError>(&name_split)) {
        return *error;
    }
    const auto [name_bytes, after_name] = std::get<SplitBytes>(name_split);

    auto salt_split = split_bytes(after_name, header.salt_len);
    if (const auto* error = std::get_if<DescriptorError>(&salt_split)) {
        return *error;
    }
    const auto [salt, after_salt] = std::get<SplitBytes>(salt_split);

    auto digest_split = split_bytes(after_salt, header.root_digest_len);
    if (const auto* error = std::get_if<DescriptorError>(&digest_split)) {
        return *error;
    }
    const auto root_digest = std::get<SplitBytes>(digest_split).head;

    // hash_algorithm is read from the raw header: it is a byte string, so
    // byte order does not matter, and the raw header borrows from the input.
    auto hash_algorithm = decode_nul_terminated(descriptor.raw_header.subspan(
        HashtreeDescriptorHeader::kHashAlgorithmOffset, WireLayout::kHashAlgorithmBytes));
    if (const auto* error = std::get_if<DescriptorError>(&hash_algorithm)) {
        return *error;
    }

    auto partition_name = decode_utf8(name_bytes);
    if (const auto* error = std::get_if<DescriptorError>(&partition_name)) {
        return *error;
    }

    HashtreeDescriptor result;
    result.dm_verity_version = header.dm_verity_version;
    result.image_size = header.image_size;
    result.tree_offset = header.tree_offset;
    result.tree_size = header.tree_size;
    result.data_block_size = header.data_block_size;
    result.hash_block_size = header.hash_block_size;
    result.fec_num_roots = header.fec_num_roots;
    result.fec_offset = header.fec_offset;
    result.fec_size = header.fec_size;
    result.hash_algorithm = std::get<std::string_view>(hash_algorithm);
    result.flags = HashtreeDescriptorFlags{ header.flags };
    result.partition_name = std::get<std::string_view>(partition_name);
    result.salt = salt;
    result.root_digest = root_digest;

    return result;
}

bool operator==(const HashtreeDescriptor& a, const HashtreeDescriptor& b) noexcept {
    return a.dm_verity_version == b.dm_verity_version &&
           a.image_size == b.image_size &&
           a.tree_offset == b.tree_offset &&
           a.tree_size == b.tree_size &&
           a.data_block_size == b.data_block_size &&
           a.hash_block_size == b.hash_block_size &&
           a.fec_num_roots == b.fec_num_roots &&
           a.fec_offset == b.fec_offset &&
           a.fec_size == b.fec_size &&
           a.hash_algorithm == b.hash_algorithm &&
           a.flags == b.flags &&
           a.partition_name == b.partition_name &&
           bytes_equal(a.salt, b.salt) &&
           bytes_equal(a.root_digest, b.root_digest);
}

}  // namespace avbdesc
