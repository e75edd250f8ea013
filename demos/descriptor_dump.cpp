// Descriptor Dump Demo
//
// Reads a descriptor region from a file and prints every descriptor.
//
// Usage:
//   ./descriptor_dump <file> [--offset N] [--length N] [--max-hex N]
//
// Options:
//   file      - file holding the region (e.g. a vbmeta auxiliary block)
//   --offset  - byte offset of the region inside the file (default: 0)
//   --length  - region length in bytes (default: rest of the file)
//   --max-hex - salt/digest/key bytes printed per field (default: 64)

#include "avbdesc/config.hpp"
#include "avbdesc/descriptor.hpp"
#include "avbdesc/descriptor_error.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace {

struct DumpOptions {
    const char* path = nullptr;
    long offset = 0;
    long length = -1;  // -1: rest of the file
    avbdesc::DumpConfig config = avbdesc::kDefaultDumpConfig;
};

// Read [offset, offset + length) of the file, capped at max_region_bytes.
bool read_region(const DumpOptions& options, std::vector<std::byte>& out) {
    std::FILE* file = std::fopen(options.path, "rb");
    if (file == nullptr) {
        std::fprintf(stderr, "Failed to open %s\n", options.path);
        return false;
    }

    if (std::fseek(file, 0, SEEK_END) != 0) {
        std::fprintf(stderr, "Failed to seek %s\n", options.path);
        std::fclose(file);
        return false;
    }
    const long file_size = std::ftell(file);
    if (file_size < 0 || options.offset > file_size) {
        std::fprintf(stderr, "Offset %ld is past the end of %s\n", options.offset, options.path);
        std::fclose(file);
        return false;
    }

    long length = file_size - options.offset;
    if (options.length >= 0) {
        if (options.length > length) {
            std::fprintf(stderr, "Region of %ld bytes does not fit in %s\n", options.length, options.path);
            std::fclose(file);
            return false;
        }
        length = options.length;
    }

    if (static_cast<std::size_t>(length) > options.config.max_region_bytes) {
        std::fprintf(stderr, "Region of %ld bytes exceeds limit of %zu\n",
                     length, options.config.max_region_bytes);
        std::fclose(file);
        return false;
    }

    out.resize(static_cast<std::size_t>(length));
    const bool ok = std::fseek(file, options.offset, SEEK_SET) == 0 &&
                    std::fread(out.data(), 1, out.size(), file) == out.size();
    std::fclose(file);
    if (!ok) {
        std::fprintf(stderr, "Failed to read %s\n", options.path);
    }
    return ok;
}

void print_hex(const char* label, std::span<const std::byte> bytes, std::size_t max_bytes) {
    std::printf("    %-26s", label);
    const std::size_t shown = bytes.size() < max_bytes ? bytes.size() : max_bytes;
    for (std::size_t i = 0; i < shown; ++i) {
        std::printf("%02x", static_cast<unsigned>(bytes[i]));
    }
    if (shown < bytes.size()) {
        std::printf("... (%zu bytes)", bytes.size());
    }
    std::printf("\n");
}

void print_text(const char* label, std::string_view text) {
    std::printf("    %-26s%.*s\n", label, static_cast<int>(text.size()), text.data());
}

void print_u64(const char* label, std::uint64_t value) {
    std::printf("    %-26s%llu\n", label, static_cast<unsigned long long>(value));
}

void print_descriptor(const avbdesc::Descriptor& descriptor, std::size_t max_hex) {
    if (const auto* d = std::get_if<avbdesc::PropertyDescriptor>(&descriptor)) {
        std::printf("  Prop:\n");
        print_text("Key:", d->key);
        print_hex("Value:", d->value, max_hex);
    } else if (const auto* d = std::get_if<avbdesc::HashtreeDescriptor>(&descriptor)) {
        std::printf("  Hashtree descriptor:\n");
        print_u64("Version of dm-verity:", d->dm_verity_version);
        print_u64("Image Size:", d->image_size);
        print_u64("Tree Offset:", d->tree_offset);
        print_u64("Tree Size:", d->tree_size);
        print_u64("Data Block Size:", d->data_block_size);
        print_u64("Hash Block Size:", d->hash_block_size);
        print_u64("FEC num roots:", d->fec_num_roots);
        print_u64("FEC offset:", d->fec_offset);
        print_u64("FEC size:", d->fec_size);
        print_text("Hash Algorithm:", d->hash_algorithm);
        print_text("Partition Name:", d->partition_name);
        print_hex("Salt:", d->salt, max_hex);
        print_hex("Root Digest:", d->root_digest, max_hex);
        print_u64("Flags:", d->flags.bits);
    } else if (const auto* d = std::get_if<avbdesc::HashDescriptor>(&descriptor)) {
        std::printf("  Hash descriptor:\n");
        print_u64("Image Size:", d->image_size);
        print_text("Hash Algorithm:", d->hash_algorithm);
        print_text("Partition Name:", d->partition_name);
        print_hex("Salt:", d->salt, max_hex);
        print_hex("Digest:", d->digest, max_hex);
        print_u64("Flags:", d->flags.bits);
    } else if (const auto* d = std::get_if<avbdesc::KernelCmdlineDescriptor>(&descriptor)) {
        std::printf("  Kernel Cmdline descriptor:\n");
        print_u64("Flags:", d->flags.bits);
        print_text("Kernel Cmdline:", d->cmdline);
    } else if (const auto* d = std::get_if<avbdesc::ChainPartitionDescriptor>(&descriptor)) {
        std::printf("  Chain Partition descriptor:\n");
        print_text("Partition Name:", d->partition_name);
        print_u64("Rollback Index Location:", d->rollback_index_location);
        print_hex("Public key:", d->public_key, max_hex);
        print_u64("Flags:", d->flags.bits);
    } else {
        const auto& unknown = std::get<avbdesc::UnknownDescriptor>(descriptor);
        std::printf("  Unknown descriptor:\n");
        print_u64("Tag:", unknown.tag);
        print_hex("Contents:", unknown.contents, max_hex);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse arguments
    DumpOptions options;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--offset") == 0 && i + 1 < argc) {
            options.offset = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--length") == 0 && i + 1 < argc) {
            options.length = std::atol(argv[++i]);
        } else if (std::strcmp(argv[i], "--max-hex") == 0 && i + 1 < argc) {
            options.config.max_hex_bytes = static_cast<std::size_t>(std::atoi(argv[++i]));
        } else {
            options.path = argv[i];
        }
    }

    if (options.path == nullptr || options.offset < 0) {
        std::fprintf(stderr, "Usage: %s <file> [--offset N] [--length N] [--max-hex N]\n", argv[0]);
        return EXIT_FAILURE;
    }

    std::vector<std::byte> region;
    if (!read_region(options, region)) {
        return EXIT_FAILURE;
    }

    auto result = avbdesc::parse_descriptors(region);
    if (const auto* error = std::get_if<avbdesc::DescriptorError>(&result)) {
        const auto name = avbdesc::descriptor_error_to_string(*error);
        std::fprintf(stderr, "Failed to parse descriptors: %.*s\n",
                     static_cast<int>(name.size()), name.data());
        return EXIT_FAILURE;
    }

    const auto& list = std::get<avbdesc::DescriptorList>(result);
    std::fprintf(stderr, "Parsed %zu descriptor(s) from %zu bytes\n", list.count, region.size());

    std::printf("Descriptors:\n");
    for (const auto& descriptor : list.items()) {
        print_descriptor(descriptor, options.config.max_hex_bytes);
    }

    return EXIT_SUCCESS;
}
