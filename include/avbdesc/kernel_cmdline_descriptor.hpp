#pragma once

#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace avbdesc {

// Kernel command line descriptor flag bits. Carried opaquely.
struct KernelCmdlineDescriptorFlags {
    static constexpr std::uint32_t kUseOnlyIfHashtreeNotDisabled = 1u << 0;
    static constexpr std::uint32_t kUseOnlyIfHashtreeDisabled = 1u << 1;

    std::uint32_t bits = 0;

    constexpr bool has(std::uint32_t flag) const noexcept { return (bits & flag) == flag; }
    friend constexpr bool operator==(KernelCmdlineDescriptorFlags, KernelCmdlineDescriptorFlags) = default;
};

// Kernel command line fragment (view into original input).
struct KernelCmdlineDescriptor {
    KernelCmdlineDescriptorFlags flags;
    std::string_view cmdline;

    friend constexpr bool operator==(const KernelCmdlineDescriptor&, const KernelCmdlineDescriptor&) = default;
};

// Parse one kernel command line descriptor.
// Body layout: command line (UTF-8, not NUL-terminated).
DescriptorResult<KernelCmdlineDescriptor> parse_kernel_cmdline_descriptor(std::span<const std::byte> bytes) noexcept;

}  // namespace avbdesc
