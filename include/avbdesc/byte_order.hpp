#pragma once

#include <cstddef>   // std::byte, std::to_integer
#include <cstdint>   // std::uint32_t, std::uint64_t
#include <limits>    // std::numeric_limits
#include <span>      // std::span

namespace avbdesc {

// Big-endian loads from a fixed offset.
//
// Precondition: offset + width <= bytes.size(). Callers only use these on
// header snapshots whose size was checked against the wire layout.

inline std::uint32_t load_be32(std::span<const std::byte> bytes, std::size_t offset) noexcept {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value = (value << 8) | std::to_integer<std::uint32_t>(bytes[offset + i]);
    }
    return value;
}

inline std::uint64_t load_be64(std::span<const std::byte> bytes, std::size_t offset) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | std::to_integer<std::uint64_t>(bytes[offset + i]);
    }
    return value;
}

// Overflow-checked accumulate: returns false (and leaves total unchanged)
// if total + value would wrap.
inline bool checked_add(std::uint64_t& total, std::uint64_t value) noexcept {
    if (value > std::numeric_limits<std::uint64_t>::max() - total) {
        return false;
    }
    total += value;
    return true;
}

}  // namespace avbdesc
