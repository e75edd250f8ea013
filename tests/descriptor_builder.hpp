#pragma once

// Reference encoder for tests: produces descriptors in the signing tool's
// wire format (big-endian header, packed body, zero padding to 8 bytes).

#include "avbdesc/config.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace avbdesc::test {

using Bytes = std::vector<std::byte>;

inline Bytes to_bytes(std::string_view text) {
    Bytes out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(static_cast<unsigned char>(text[i]));
    }
    return out;
}

// Pattern fill (0x00, 0x01, ... + seed) so misordered fields are detectable
inline Bytes pattern(std::size_t n, std::uint8_t seed) {
    Bytes out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = static_cast<std::byte>(static_cast<std::uint8_t>(seed + i));
    }
    return out;
}

inline void store_be32(Bytes& bytes, std::size_t offset, std::uint32_t v) {
    for (std::size_t i = 0; i < 4; ++i) {
        bytes[offset + i] = static_cast<std::byte>((v >> (24 - 8 * i)) & 0xFF);
    }
}

inline void store_be64(Bytes& bytes, std::size_t offset, std::uint64_t v) {
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[offset + i] = static_cast<std::byte>((v >> (56 - 8 * i)) & 0xFF);
    }
}

inline bool same_bytes(std::span<const std::byte> a, std::span<const std::byte> b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
    }
    return true;
}

// Appends big-endian fields to a growing buffer
class WireWriter {
public:
    void u32(std::uint32_t v) {
        const std::size_t at = bytes_.size();
        bytes_.resize(at + 4);
        store_be32(bytes_, at, v);
    }

    void u64(std::uint64_t v) {
        const std::size_t at = bytes_.size();
        bytes_.resize(at + 8);
        store_be64(bytes_, at, v);
    }

    void raw(std::span<const std::byte> data) {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    void zeros(std::size_t n) {
        bytes_.resize(bytes_.size() + n, std::byte{0});
    }

    // Fixed-width text: truncated to width, zero-filled after
    void fixed_text(std::string_view text, std::size_t width) {
        const Bytes b = to_bytes(text.substr(0, width));
        raw(b);
        zeros(width - b.size());
    }

    [[nodiscard]] std::size_t size() const { return bytes_.size(); }
    Bytes take() { return std::move(bytes_); }

private:
    Bytes bytes_;
};

// Header (fixed part) + body + zero padding; num_bytes_following covers all
// of it and is rounded up to the descriptor alignment.
inline Bytes finish(DescriptorTag tag, WireWriter fixed, std::span<const std::byte> body) {
    const std::size_t unpadded = fixed.size() + body.size();
    const std::size_t align = WireLayout::kDescriptorAlignment;
    const std::size_t padded = (unpadded + align - 1) / align * align;

    WireWriter out;
    out.u64(static_cast<std::uint64_t>(tag));
    out.u64(padded);
    out.raw(fixed.take());
    out.raw(body);
    out.zeros(padded - unpadded);
    return out.take();
}

struct HashtreeFields {
    std::uint32_t dm_verity_version = 1;
    std::uint64_t image_size = 0;
    std::uint64_t tree_offset = 0;
    std::uint64_t tree_size = 0;
    std::uint32_t data_block_size = 4096;
    std::uint32_t hash_block_size = 4096;
    std::uint32_t fec_num_roots = 0;
    std::uint64_t fec_offset = 0;
    std::uint64_t fec_size = 0;
    std::string hash_algorithm = "sha1";
    std::uint32_t flags = 0;
    std::string partition_name;
    Bytes salt;
    Bytes root_digest;
};

inline Bytes encode_hashtree(const HashtreeFields& f) {
    const Bytes name = to_bytes(f.partition_name);

    WireWriter fixed;
    fixed.u32(f.dm_verity_version);
    fixed.u64(f.image_size);
    fixed.u64(f.tree_offset);
    fixed.u64(f.tree_size);
    fixed.u32(f.data_block_size);
    fixed.u32(f.hash_block_size);
    fixed.u32(f.fec_num_roots);
    fixed.u64(f.fec_offset);
    fixed.u64(f.fec_size);
    fixed.fixed_text(f.hash_algorithm, WireLayout::kHashAlgorithmBytes);
    fixed.u32(static_cast<std::uint32_t>(name.size()));
    fixed.u32(static_cast<std::uint32_t>(f.salt.size()));
    fixed.u32(static_cast<std::uint32_t>(f.root_digest.size()));
    fixed.u32(f.flags);
    fixed.zeros(WireLayout::kReservedBytes);

    WireWriter body;
    body.raw(name);
    body.raw(f.salt);
    body.raw(f.root_digest);
    return finish(DescriptorTag::Hashtree, std::move(fixed), body.take());
}

struct HashFields {
    std::uint64_t image_size = 0;
    std::string hash_algorithm = "sha256";
    std::uint32_t flags = 0;
    std::string partition_name;
    Bytes salt;
    Bytes digest;
};

inline Bytes encode_hash(const HashFields& f) {
    const Bytes name = to_bytes(f.partition_name);

    WireWriter fixed;
    fixed.u64(f.image_size);
    fixed.fixed_text(f.hash_algorithm, WireLayout::kHashAlgorithmBytes);
    fixed.u32(static_cast<std::uint32_t>(name.size()));
    fixed.u32(static_cast<std::uint32_t>(f.salt.size()));
    fixed.u32(static_cast<std::uint32_t>(f.digest.size()));
    fixed.u32(f.flags);
    fixed.zeros(WireLayout::kReservedBytes);

    WireWriter body;
    body.raw(name);
    body.raw(f.salt);
    body.raw(f.digest);
    return finish(DescriptorTag::Hash, std::move(fixed), body.take());
}

inline Bytes encode_property(std::string_view key, std::span<const std::byte> value) {
    WireWriter fixed;
    fixed.u64(key.size());
    fixed.u64(value.size());

    WireWriter body;
    body.raw(to_bytes(key));
    body.zeros(1);
    body.raw(value);
    body.zeros(1);
    return finish(DescriptorTag::Property, std::move(fixed), body.take());
}

inline Bytes encode_kernel_cmdline(std::uint32_t flags, std::string_view cmdline) {
    WireWriter fixed;
    fixed.u32(flags);
    fixed.u32(static_cast<std::uint32_t>(cmdline.size()));
    return finish(DescriptorTag::KernelCmdline, std::move(fixed), to_bytes(cmdline));
}

inline Bytes encode_chain_partition(std::uint32_t rollback_index_location, std::uint32_t flags,
                                    std::string_view partition_name,
                                    std::span<const std::byte> public_key) {
    const Bytes name = to_bytes(partition_name);

    WireWriter fixed;
    fixed.u32(rollback_index_location);
    fixed.u32(static_cast<std::uint32_t>(name.size()));
    fixed.u32(static_cast<std::uint32_t>(public_key.size()));
    fixed.u32(flags);
    fixed.zeros(WireLayout::kReservedBytes);

    WireWriter body;
    body.raw(name);
    body.raw(public_key);
    return finish(DescriptorTag::ChainPartition, std::move(fixed), body.take());
}

// Descriptor with an arbitrary tag and opaque payload
inline Bytes encode_opaque(std::uint64_t tag, std::span<const std::byte> payload) {
    return finish(static_cast<DescriptorTag>(tag), WireWriter{}, payload);
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& p : parts) {
        out.insert(out.end(), p.begin(), p.end());
    }
    return out;
}

}  // namespace avbdesc::test
