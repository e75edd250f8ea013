#include "avbdesc/kernel_cmdline_descriptor.hpp"

#include "avbdesc/parse_descriptor.hpp"
#include "avbdesc/text.hpp"

#include <variant>

namespace avbdesc {

DescriptorResult<KernelCmdlineDescriptor> parse_kernel_cmdline_descriptor(std::span<const std::byte> bytes) noexcept {
    auto parsed = parse_descriptor<KernelCmdlineDescriptorHeader>(bytes);
    if (const auto* error = std::get_if<DescriptorError>(&parsed)) {
        return *error;
    }
    const auto& descriptor = std::get<ParsedDescriptor<KernelCmdlineDescriptorHeader>>(parsed);

    auto cmdline_split = split_bytes(descriptor.body, descriptor.header.kernel_cmdline_length);
    if (const auto* error = std::get_if<DescriptorError>(&cmdline_split)) {
        return *error;
    }

    auto cmdline = decode_utf8(std::get<SplitBytes>(cmdline_split).head);
    if (const auto* error = std::get_if<DescriptorError>(&cmdline)) {
        return *error;
    }

    return KernelCmdlineDescriptor{
        KernelCmdlineDescriptorFlags{ descriptor.header.flags },
        std::get<std::string_view>(cmdline),
    };
}

}  // namespace avbdesc
