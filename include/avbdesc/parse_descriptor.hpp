#pragma once

#include "avbdesc/config.hpp"
#include "avbdesc/descriptor_error.hpp"
#include "avbdesc/validate_headers.hpp"

#include <cstddef>   // std::byte, std::size_t
#include <cstdint>   // std::uint64_t
#include <limits>    // std::numeric_limits
#include <span>      // std::span
#include <variant>   // std::variant

namespace avbdesc {

// ============================================================================
// Generic descriptor parsing.
//
// Every descriptor is: fixed header (wire size per kind) + body + padding.
// The header is decoded by the validator bound to its type through
// HeaderTraits; the body length is re-derived from the validated
// num_bytes_following.
// ============================================================================

// Binds a header type to its wire size and its validator.
// Specialized once per kind below; there is no runtime registry.
template <typename Header>
struct HeaderTraits;

template <>
struct HeaderTraits<PropertyDescriptorHeader> {
    static constexpr std::size_t kWireSize = WireLayout::kPropertyHeaderBytes;
    static constexpr auto validate = &validate_property_header;
};

template <>
struct HeaderTraits<HashtreeDescriptorHeader> {
    static constexpr std::size_t kWireSize = WireLayout::kHashtreeHeaderBytes;
    static constexpr auto validate = &validate_hashtree_header;
};

template <>
struct HeaderTraits<HashDescriptorHeader> {
    static constexpr std::size_t kWireSize = WireLayout::kHashHeaderBytes;
    static constexpr auto validate = &validate_hash_header;
};

template <>
struct HeaderTraits<KernelCmdlineDescriptorHeader> {
    static constexpr std::size_t kWireSize = WireLayout::kKernelCmdlineHeaderBytes;
    static constexpr auto validate = &validate_kernel_cmdline_header;
};

template <>
struct HeaderTraits<ChainPartitionDescriptorHeader> {
    static constexpr std::size_t kWireSize = WireLayout::kChainPartitionHeaderBytes;
    static constexpr auto validate = &validate_chain_partition_header;
};

// On success we return the host-order header plus bounded *views* into the
// original input.
template <typename Header>
struct ParsedDescriptor {
    Header header;                                                           // host byte order
    std::span<const std::byte, HeaderTraits<Header>::kWireSize> raw_header;  // wire byte order
    std::span<const std::byte> body;                                         // sub-fields + padding
};

// Split result: first `length` bytes and the remainder.
struct SplitBytes {
    std::span<const std::byte> head;
    std::span<const std::byte> rest;
};

// Bounds-checked split.
//
// Contract:
// - Returns InvalidSize if length > bytes.size()
// - Takes a 64-bit length so header fields are checked before any narrowing
// - Never reads out of bounds
DescriptorResult<SplitBytes> split_bytes(std::span<const std::byte> bytes,
                                         std::uint64_t length) noexcept;

// Byte-wise equality of two borrowed fields (used by view comparisons)
bool bytes_equal(std::span<const std::byte> a, std::span<const std::byte> b) noexcept;

// Parse the header and locate the body of one descriptor.
//
// Precondition: bytes start at the descriptor's tag.
//
// Contract:
// - InvalidHeader if bytes are shorter than the header or the validator rejects it
// - InvalidValue if the body length does not fit std::size_t
// - The body is the declared extent, cut short if the input ends first; a
//   missing tail (e.g. alignment padding) is not an error here
// - Bytes beyond the declared extent are ignored
// - Never allocates, never throws
// - Returns views into the original input (caller must keep input alive)
template <typename Header>
DescriptorResult<ParsedDescriptor<Header>> parse_descriptor(std::span<const std::byte> bytes) noexcept {
    using Traits = HeaderTraits<Header>;

    if (bytes.size() < Traits::kWireSize) {
        return DescriptorError::InvalidHeader;
    }

    const auto raw_header = bytes.first<Traits::kWireSize>();

    Header header{};
    if (!Traits::validate(raw_header, header)) {
        return DescriptorError::InvalidHeader;
    }

    // The validator guarantees num_bytes_following covers the fixed payload.
    const std::uint64_t body_len = header.parent.num_bytes_following -
        static_cast<std::uint64_t>(Traits::kWireSize - WireLayout::kGenericHeaderBytes);
    if (body_len > std::numeric_limits<std::size_t>::max()) {
        return DescriptorError::InvalidValue;
    }

    // Trailing alignment padding may be missing; sub-field splits catch
    // anything shorter.
    const auto after_header = bytes.subspan(Traits::kWireSize);
    const std::size_t available = after_header.size();
    const std::size_t present = body_len < static_cast<std::uint64_t>(available)
        ? static_cast<std::size_t>(body_len)
        : available;

    return ParsedDescriptor<Header>{
        header,
        raw_header,
        after_header.first(present),
    };
}

}  // namespace avbdesc
