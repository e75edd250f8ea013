#include "avbdesc/chain_partition_descriptor.hpp"

#include "avbdesc/parse_descriptor.hpp"
#include "avbdesc/text.hpp"

#include <variant>

namespace avbdesc {

DescriptorResult<ChainPartitionDescriptor> parse_chain_partition_descriptor(std::span<const std::byte> bytes) noexcept {
    auto parsed = parse_descriptor<ChainPartitionDescriptorHeader>(bytes);
    if (const auto* error = std::get_if<DescriptorError>(&parsed)) {
        return *error;
    }
    const auto& descriptor = std::get<ParsedDescriptor<ChainPartitionDescriptorHeader>>(parsed);
    const auto& header = descriptor.header;

    auto name_split = split_bytes(descriptor.body, header.partition_name_len);
    if (const auto* error = std::get_if<DescriptorError>(&name_split)) {
        return *error;
    }
    const auto [name_bytes, after_name] = std::get<SplitBytes>(name_split);

    auto key_split = split_bytes(after_name, header.public_key_len);
    if (const auto* error = std::get_if<DescriptorError>(&key_split)) {
        return *error;
    }

    auto partition_name = decode_utf8(name_bytes);
    if (const auto* error = std::get_if<DescriptorError>(&partition_name)) {
        return *error;
    }

    ChainPartitionDescriptor result;
    result.rollback_index_location = header.rollback_index_location;
    result.flags = ChainPartitionDescriptorFlags{ header.flags };
    result.partition_name = std::get<std::string_view>(partition_name);
    result.public_key = std::get<SplitBytes>(key_split).head;

    return result;
}

bool operator==(const ChainPartitionDescriptor& a, const ChainPartitionDescriptor& b) noexcept {
    return a.rollback_index_location == b.rollback_index_location &&
           a.flags == b.flags &&
           a.partition_name == b.partition_name &&
           bytes_equal(a.public_key, b.public_key);
}

}  // namespace avbdesc
