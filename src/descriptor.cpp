#include "avbdesc/descriptor.hpp"

#include "avbdesc/validate_headers.hpp"

namespace avbdesc {

namespace {

constexpr std::size_t kHeaderBytes = WireLayout::kGenericHeaderBytes;

template <typename View>
DescriptorResult<Descriptor> to_descriptor(const DescriptorResult<View>& result) noexcept {
    if (const auto* error = std::get_if<DescriptorError>(&result)) {
        return *error;
    }
    return Descriptor{ std::get<View>(result) };
}

}  // namespace

DescriptorResult<Descriptor> parse_descriptor_record(std::span<const std::byte> bytes) noexcept {
    if (bytes.size() < kHeaderBytes) {
        return DescriptorError::InvalidHeader;
    }

    DescriptorHeader header;
    if (!validate_descriptor_header(bytes.first<kHeaderBytes>(), header)) {
        return DescriptorError::InvalidHeader;
    }

    // Limit the record to its declared extent, or to the input if that ends
    // first (missing padding is left to the extractor to judge)
    const std::size_t available = bytes.size() - kHeaderBytes;
    const std::size_t following = header.num_bytes_following < static_cast<std::uint64_t>(available)
        ? static_cast<std::size_t>(header.num_bytes_following)
        : available;
    const auto contents = bytes.first(kHeaderBytes + following);

    switch (static_cast<DescriptorTag>(header.tag)) {
        case DescriptorTag::Property:
            return to_descriptor(parse_property_descriptor(contents));
        case DescriptorTag::Hashtree:
            return to_descriptor(parse_hashtree_descriptor(contents));
        case DescriptorTag::Hash:
            return to_descriptor(parse_hash_descriptor(contents));
        case DescriptorTag::KernelCmdline:
            return to_descriptor(parse_kernel_cmdline_descriptor(contents));
        case DescriptorTag::ChainPartition:
            return to_descriptor(parse_chain_partition_descriptor(contents));
    }

    return Descriptor{ UnknownDescriptor{ header.tag, contents } };
}

DescriptorResult<DescriptorList> parse_descriptors(std::span<const std::byte> region) noexcept {
    DescriptorList list{};

    auto remaining = region;
    while (!remaining.empty()) {
        if (remaining.size() < kHeaderBytes) {
            return DescriptorError::InvalidContents;
        }

        DescriptorHeader header;
        if (!validate_descriptor_header(remaining.first<kHeaderBytes>(), header)) {
            return DescriptorError::InvalidContents;
        }

        // num_bytes_following is attacker-controlled; compare without adding
        if (header.num_bytes_following > static_cast<std::uint64_t>(remaining.size() - kHeaderBytes)) {
            return DescriptorError::InvalidContents;
        }
        const std::size_t record_bytes = kHeaderBytes + static_cast<std::size_t>(header.num_bytes_following);

        // Bound iteration count
        if (list.count >= DescriptorLimits::kMaxDescriptors) {
            return DescriptorError::TooManyDescriptors;
        }

        auto record = parse_descriptor_record(remaining.first(record_bytes));
        if (const auto* error = std::get_if<DescriptorError>(&record)) {
            return *error;
        }
        list.descriptors[list.count] = std::get<Descriptor>(record);
        ++list.count;

        remaining = remaining.subspan(record_bytes);
    }

    return list;
}

std::uint64_t descriptor_tag(const Descriptor& descriptor) noexcept {
    if (std::holds_alternative<PropertyDescriptor>(descriptor)) {
        return static_cast<std::uint64_t>(DescriptorTag::Property);
    }
    if (std::holds_alternative<HashtreeDescriptor>(descriptor)) {
        return static_cast<std::uint64_t>(DescriptorTag::Hashtree);
    }
    if (std::holds_alternative<HashDescriptor>(descriptor)) {
        return static_cast<std::uint64_t>(DescriptorTag::Hash);
    }
    if (std::holds_alternative<KernelCmdlineDescriptor>(descriptor)) {
        return static_cast<std::uint64_t>(DescriptorTag::KernelCmdline);
    }
    if (std::holds_alternative<ChainPartitionDescriptor>(descriptor)) {
        return static_cast<std::uint64_t>(DescriptorTag::ChainPartition);
    }
    return std::get<UnknownDescriptor>(descriptor).tag;
}

}  // namespace avbdesc
