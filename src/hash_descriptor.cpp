#include "avbdesc/hash_descriptor.hpp"

#include "avbdesc/parse_descriptor.hpp"
#include "avbdesc/text.hpp"

#include <variant>

namespace avbdesc {

DescriptorResult<HashDescriptor> parse_hash_descriptor(std::span<const std::byte> bytes) noexcept {
    auto parsed = parse_descriptor<HashDescriptorHeader>(bytes);
    if (const auto* error = std::get_if<DescriptorError>(&parsed)) {
        return *error;
    }
    const auto& descriptor = std::get<ParsedDescriptor<HashDescriptorHeader>>(parsed);
    const auto& header = descriptor.header;

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

    auto digest_split = split_bytes(after_salt, header.digest_len);
    if (const auto* error = std::get_if<DescriptorError>(&digest_split)) {
        return *error;
    }

    auto hash_algorithm = decode_nul_terminated(descriptor.raw_header.subspan(
        HashDescriptorHeader::kHashAlgorithmOffset, WireLayout::kHashAlgorithmBytes));
    if (const auto* error = std::get_if<DescriptorError>(&hash_algorithm)) {
        return *error;
    }

    auto partition_name = decode_utf8(name_bytes);
    if (const auto* error = std::get_if<DescriptorError>(&partition_name)) {
        return *error;
    }

    HashDescriptor result;
    result.image_size = header.image_size;
    result.hash_algorithm = std::get<std::string_view>(hash_algorithm);
    result.flags = HashDescriptorFlags{ header.flags };
    result.partition_name = std::get<std::string_view>(partition_name);
    result.salt = salt;
    result.digest = std::get<SplitBytes>(digest_split).head;

    return result;
}

bool operator==(const HashDescriptor& a, const HashDescriptor& b) noexcept {
    return a.image_size == b.image_size &&
           a.hash_algorithm == b.hash_algorithm &&
           a.flags == b.flags &&
           a.partition_name == b.partition_name &&
           bytes_equal(a.salt, b.salt) &&
           bytes_equal(a.digest, b.digest);
}

}  // namespace avbdesc
