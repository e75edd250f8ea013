#pragma once

#include <cstddef>
#include <cstdint>

namespace avbdesc {

// Descriptor tags as written by the signing tool.
// The per-kind extractors never read the tag; only dispatch does.
enum class DescriptorTag : std::uint64_t {
    Property = 0,
    Hashtree = 1,
    Hash = 2,
    KernelCmdline = 3,
    ChainPartition = 4,
};

// Wire layout constants (big-endian, packed, no implicit padding)
struct WireLayout {
    static constexpr std::size_t kGenericHeaderBytes = 16;     // tag + num_bytes_following
    static constexpr std::size_t kDescriptorAlignment = 8;     // num_bytes_following % 8 == 0
    static constexpr std::size_t kHashAlgorithmBytes = 32;     // NUL-terminated, fixed width
    static constexpr std::size_t kReservedBytes = 60;

    static constexpr std::size_t kPropertyHeaderBytes = 32;
    static constexpr std::size_t kHashtreeHeaderBytes = 180;
    static constexpr std::size_t kHashHeaderBytes = 132;
    static constexpr std::size_t kKernelCmdlineHeaderBytes = 24;
    static constexpr std::size_t kChainPartitionHeaderBytes = 92;
};

// Walker limits (compile-time constants for bounded allocation)
struct DescriptorLimits {
    static constexpr std::size_t kMaxDescriptors = 64;
};

// Descriptor dump demo configuration
struct DumpConfig {
    std::size_t max_region_bytes = 64 * 1024;  // vbmeta images are capped at 64 KiB
    std::size_t max_hex_bytes = 64;            // salt/digest/key bytes printed per field
};

// Conservative defaults suitable for inspecting signing-tool output
inline constexpr DumpConfig kDefaultDumpConfig = {};

}  // namespace avbdesc
