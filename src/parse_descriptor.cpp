#include "avbdesc/parse_descriptor.hpp"

#include <algorithm>  // std::equal

namespace avbdesc {

DescriptorResult<SplitBytes> split_bytes(std::span<const std::byte> bytes,
                                         std::uint64_t length) noexcept {
    // compare in 64 bits before narrowing; size_t may be 32 bits
    if (length > static_cast<std::uint64_t>(bytes.size())) {
        return DescriptorError::InvalidSize;
    }

    const auto n = static_cast<std::size_t>(length);
    return SplitBytes{ bytes.first(n), bytes.subspan(n) };
}

bool bytes_equal(std::span<const std::byte> a, std::span<const std::byte> b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

}  // namespace avbdesc
