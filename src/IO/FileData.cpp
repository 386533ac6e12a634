#include "FileData.h"

#include <cstdint>

namespace AsyncFile::Core::IO {

std::string FileData::text() const {
    return std::string(reinterpret_cast<const char*>(_bytes.data()), _bytes.size());
}

std::vector<std::byte> FileData::intoBytes() && noexcept {
    std::vector<std::byte> out;
    out.swap(_bytes);
    return out;
}

size_t FileData::hash() const noexcept {
    // FNV-1a, 64-bit
    uint64_t h = 14695981039346656037ull;
    for (std::byte b : _bytes) {
        h ^= static_cast<uint64_t>(b);
        h *= 1099511628211ull;
    }
    return static_cast<size_t>(h);
}

} // namespace AsyncFile::Core::IO
