#pragma once

#include "avbdesc/chain_partition_descriptor.hpp"
#include "avbdesc/config.hpp"
#include "avbdesc/descriptor_error.hpp"
#include "avbdesc/hash_descriptor.hpp"
#include "avbdesc/hashtree_descriptor.hpp"
#include "avbdesc/kernel_cmdline_descriptor.hpp"
#include "avbdesc/property_descriptor.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>

namespace avbdesc {

// ============================================================================
// Descriptor dispatch and descriptor region walking.
//
// A descriptor region is the concatenation of descriptor records, each
// 16 + num_bytes_following bytes long, as found in a vbmeta auxiliary block.
//
// Invariants enforced:
// 1. Memory: DescriptorList capacity is a compile-time constant.
// 2. CPU: single pass over the region, O(n).
// 3. All-or-nothing: one malformed record fails the whole region.
// ============================================================================

// Record with a tag this library does not know (raw bytes, header included).
struct UnknownDescriptor {
    std::uint64_t tag;
    std::span<const std::byte> contents;
};

// One parsed descriptor of any kind.
using Descriptor = std::variant<
    PropertyDescriptor,
    HashtreeDescriptor,
    HashDescriptor,
    KernelCmdlineDescriptor,
    ChainPartitionDescriptor,
    UnknownDescriptor
>;

// Parsed descriptor region (views into original input, no allocation)
struct DescriptorList {
    std::array<Descriptor, DescriptorLimits::kMaxDescriptors> descriptors;
    std::size_t count;               // actual number of descriptors

    [[nodiscard]] std::span<const Descriptor> items() const noexcept {
        return std::span<const Descriptor>(descriptors.data(), count);
    }
};

// Parse one descriptor record, dispatching on its tag.
//
// Precondition: bytes start at the record's tag. Bytes past
// 16 + num_bytes_following are ignored.
//
// Contract:
// - InvalidHeader if the generic header is short or misaligned
// - A record cut short by the end of the input is passed on as-is; the
//   extractor reports InvalidSize only if a sub-field is incomplete
// - Otherwise the per-kind extractor's result, unchanged
// - Unknown tags yield UnknownDescriptor, not an error
DescriptorResult<Descriptor> parse_descriptor_record(std::span<const std::byte> bytes) noexcept;

// Parse every record of a descriptor region.
//
// Contract:
// - InvalidContents if a record header is truncated, misaligned, or claims
//   more bytes than the region holds
// - TooManyDescriptors past DescriptorLimits::kMaxDescriptors
// - A record that fails to parse fails the region with its own error
// - Never throws
// - Returns views into the original input (caller must keep input alive)
DescriptorResult<DescriptorList> parse_descriptors(std::span<const std::byte> region) noexcept;

// Tag of a parsed descriptor (for logging)
std::uint64_t descriptor_tag(const Descriptor& descriptor) noexcept;

}  // namespace avbdesc
