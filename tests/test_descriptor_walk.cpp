#include "avbdesc/descriptor.hpp"
#include "avbdesc/config.hpp"

#include "descriptor_builder.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <span>
#include <variant>

// Descriptor dispatch and region walking tests.

namespace {

using avbdesc::test::Bytes;

bool is_region_error(const avbdesc::DescriptorResult<avbdesc::DescriptorList>& r,
                     avbdesc::DescriptorError error) {
    if (const auto* e = std::get_if<avbdesc::DescriptorError>(&r)) {
        return *e == error;
    }
    return false;
}

bool is_record_error(const avbdesc::DescriptorResult<avbdesc::Descriptor>& r,
                     avbdesc::DescriptorError error) {
    if (const auto* e = std::get_if<avbdesc::DescriptorError>(&r)) {
        return *e == error;
    }
    return false;
}

Bytes system_hashtree() {
    avbdesc::test::HashtreeFields f;
    f.image_size = 0x4000;
    f.tree_offset = 0x4000;
    f.tree_size = 0x1000;
    f.partition_name = "system";
    f.salt = avbdesc::test::pattern(20, 0x10);
    f.root_digest = avbdesc::test::pattern(20, 0x40);
    return avbdesc::test::encode_hashtree(f);
}

Bytes boot_hash() {
    avbdesc::test::HashFields f;
    f.image_size = 0x1000;
    f.partition_name = "boot";
    f.salt = avbdesc::test::pattern(32, 0);
    f.digest = avbdesc::test::pattern(32, 0x20);
    return avbdesc::test::encode_hash(f);
}

}  // namespace

int main() {
    // =========================================================================
    // parse_descriptor_record
    // =========================================================================

    // Test 1: Each known tag dispatches to its own kind
    {
        const Bytes key = avbdesc::test::pattern(16, 0);
        const Bytes records[] = {
            avbdesc::test::encode_property("ro.build", avbdesc::test::to_bytes("eng")),
            system_hashtree(),
            boot_hash(),
            avbdesc::test::encode_kernel_cmdline(0, "quiet"),
            avbdesc::test::encode_chain_partition(1, 0, "vbmeta_system", key),
        };
        for (std::size_t i = 0; i < 5; ++i) {
            auto r = avbdesc::parse_descriptor_record(records[i]);
            const auto* d = std::get_if<avbdesc::Descriptor>(&r);
            if (d == nullptr || d->index() != i || avbdesc::descriptor_tag(*d) != i) {
                std::printf("Dispatch test failed for tag %zu\n", i);
                return EXIT_FAILURE;
            }
        }
    }

    // Test 2: Unknown tag -> UnknownDescriptor covering the whole record
    {
        const Bytes payload = avbdesc::test::pattern(5, 0xA0);
        const Bytes bytes = avbdesc::test::encode_opaque(42, payload);
        auto r = avbdesc::parse_descriptor_record(bytes);
        const auto* d = std::get_if<avbdesc::Descriptor>(&r);
        const auto* u = d ? std::get_if<avbdesc::UnknownDescriptor>(d) : nullptr;
        if (u == nullptr || u->tag != 42 || u->contents.data() != bytes.data() ||
            u->contents.size() != 24 || avbdesc::descriptor_tag(*d) != 42) {
            std::printf("Unknown tag test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 3: Short generic header -> InvalidHeader, cut into the cmdline ->
    // InvalidSize, cut into the padding only -> parses
    {
        const Bytes bytes = avbdesc::test::encode_kernel_cmdline(0, "quiet");
        const std::size_t cmdline_end = avbdesc::WireLayout::kKernelCmdlineHeaderBytes + 5;
        std::span<const std::byte> header_cut(bytes.data(), 15);
        std::span<const std::byte> body_cut(bytes.data(), cmdline_end - 1);
        std::span<const std::byte> padding_cut(bytes.data(), cmdline_end);
        if (!is_record_error(avbdesc::parse_descriptor_record(header_cut), avbdesc::DescriptorError::InvalidHeader) ||
            !is_record_error(avbdesc::parse_descriptor_record(body_cut), avbdesc::DescriptorError::InvalidSize)) {
            std::printf("Record truncation test failed\n");
            return EXIT_FAILURE;
        }
        auto r = avbdesc::parse_descriptor_record(padding_cut);
        const auto* d = std::get_if<avbdesc::Descriptor>(&r);
        const auto* cmd = d ? std::get_if<avbdesc::KernelCmdlineDescriptor>(d) : nullptr;
        if (cmd == nullptr || cmd->cmdline != "quiet") {
            std::printf("Record truncation test failed: missing padding rejected\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: Extractor errors pass through unchanged
    {
        const Bytes bytes = avbdesc::test::encode_kernel_cmdline(0, "\xFF");
        if (!is_record_error(avbdesc::parse_descriptor_record(bytes), avbdesc::DescriptorError::InvalidText)) {
            std::printf("Record error passthrough test failed\n");
            return EXIT_FAILURE;
        }
    }

    // =========================================================================
    // parse_descriptors
    // =========================================================================

    // Test 5: Empty region -> zero descriptors
    {
        const std::span<const std::byte> empty;
        auto r = avbdesc::parse_descriptors(empty);
        const auto* list = std::get_if<avbdesc::DescriptorList>(&r);
        if (list == nullptr || list->count != 0 || !list->items().empty()) {
            std::printf("Empty region test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 6: Mixed region keeps record order and borrows from the input
    {
        const Bytes hashtree = system_hashtree();
        const Bytes region = avbdesc::test::concat({
            hashtree,
            boot_hash(),
            avbdesc::test::encode_opaque(7, avbdesc::test::pattern(3, 0)),
            avbdesc::test::encode_kernel_cmdline(1, "root=/dev/dm-0"),
        });
        auto r = avbdesc::parse_descriptors(region);
        const auto* list = std::get_if<avbdesc::DescriptorList>(&r);
        if (list == nullptr || list->count != 4) {
            std::printf("Mixed region test failed: wrong count\n");
            return EXIT_FAILURE;
        }
        const auto items = list->items();
        const std::uint64_t expected_tags[] = { 1, 2, 7, 3 };
        for (std::size_t i = 0; i < 4; ++i) {
            if (avbdesc::descriptor_tag(items[i]) != expected_tags[i]) {
                std::printf("Mixed region test failed: wrong tag at %zu\n", i);
                return EXIT_FAILURE;
            }
        }
        const auto& ht = std::get<avbdesc::HashtreeDescriptor>(items[0]);
        const auto* name_start = reinterpret_cast<const char*>(region.data()) +
                                 avbdesc::WireLayout::kHashtreeHeaderBytes;
        if (ht.partition_name != "system" || ht.partition_name.data() != name_start) {
            std::printf("Mixed region test failed: hashtree not borrowed\n");
            return EXIT_FAILURE;
        }
        const auto& cmd = std::get<avbdesc::KernelCmdlineDescriptor>(items[3]);
        if (cmd.cmdline != "root=/dev/dm-0") {
            std::printf("Mixed region test failed: wrong cmdline\n");
            return EXIT_FAILURE;
        }
    }

    // Test 7: Truncated trailing header -> InvalidContents
    {
        Bytes region = boot_hash();
        region.resize(region.size() + 8, std::byte{0});
        if (!is_region_error(avbdesc::parse_descriptors(region), avbdesc::DescriptorError::InvalidContents)) {
            std::printf("Truncated header test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 8: Record claims more than the region holds -> InvalidContents
    {
        const Bytes region = system_hashtree();
        std::span<const std::byte> cut(region.data(), region.size() - 8);
        if (!is_region_error(avbdesc::parse_descriptors(cut), avbdesc::DescriptorError::InvalidContents)) {
            std::printf("Overrun test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 9: Huge num_bytes_following -> InvalidContents
    {
        Bytes region = avbdesc::test::encode_kernel_cmdline(0, "quiet");
        avbdesc::test::store_be64(region, 8, 0xFFFFFFFFFFFFFFF8ull);
        if (!is_region_error(avbdesc::parse_descriptors(region), avbdesc::DescriptorError::InvalidContents)) {
            std::printf("Huge extent test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 10: Misaligned num_bytes_following -> InvalidContents
    {
        Bytes region = avbdesc::test::encode_opaque(9, avbdesc::test::pattern(16, 0));
        avbdesc::test::store_be64(region, 8, 12);
        if (!is_region_error(avbdesc::parse_descriptors(region), avbdesc::DescriptorError::InvalidContents)) {
            std::printf("Misaligned extent test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 11: One bad record fails the whole region with its own error
    {
        const Bytes region = avbdesc::test::concat({
            boot_hash(),
            avbdesc::test::encode_property("\xC3\x28", avbdesc::test::to_bytes("x")),
        });
        if (!is_region_error(avbdesc::parse_descriptors(region), avbdesc::DescriptorError::InvalidText)) {
            std::printf("Record error propagation test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 12: Capacity boundary
    {
        const Bytes record = avbdesc::test::encode_opaque(100, {});
        Bytes full;
        for (std::size_t i = 0; i < avbdesc::DescriptorLimits::kMaxDescriptors; ++i) {
            full.insert(full.end(), record.begin(), record.end());
        }
        auto r = avbdesc::parse_descriptors(full);
        const auto* list = std::get_if<avbdesc::DescriptorList>(&r);
        if (list == nullptr || list->count != avbdesc::DescriptorLimits::kMaxDescriptors) {
            std::printf("Capacity test failed: full list rejected\n");
            return EXIT_FAILURE;
        }

        Bytes over = full;
        over.insert(over.end(), record.begin(), record.end());
        if (!is_region_error(avbdesc::parse_descriptors(over), avbdesc::DescriptorError::TooManyDescriptors)) {
            std::printf("Capacity test failed: overflow not rejected\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All descriptor walk tests passed\n");
    return EXIT_SUCCESS;
}
