#pragma once
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace AsyncFile::Core::IO {

/**
 * Immutable bytes produced by a read.
 *
 * A FileData is only ever constructed by a backend after the underlying write
 * into its storage has finished, so callers never hold a view into memory that
 * is still being filled. It is move-only; intoBytes() hands the storage over
 * without copying.
 */
class FileData {
public:
    FileData() = default;
    FileData(FileData&&) noexcept = default;
    FileData& operator=(FileData&&) noexcept = default;
    FileData(const FileData&) = delete;
    FileData& operator=(const FileData&) = delete;

    std::span<const std::byte> bytes() const noexcept { return {_bytes.data(), _bytes.size()}; }
    const std::byte* data() const noexcept { return _bytes.data(); }
    size_t size() const noexcept { return _bytes.size(); }
    bool empty() const noexcept { return _bytes.empty(); }

    // Bytes reinterpreted as characters; no encoding validation
    std::string text() const;

    // Releases the owned storage. The FileData is empty afterwards.
    std::vector<std::byte> intoBytes() && noexcept;

    size_t hash() const noexcept;

    friend bool operator==(const FileData& a, const FileData& b) noexcept { return a._bytes == b._bytes; }

private:
    explicit FileData(std::vector<std::byte> completed) noexcept : _bytes(std::move(completed)) {}

    friend class LocalOpenFile;
    friend class RemoteOpenFile;

    std::vector<std::byte> _bytes;
};

} // namespace AsyncFile::Core::IO

template <>
struct std::hash<AsyncFile::Core::IO::FileData> {
    size_t operator()(const AsyncFile::Core::IO::FileData& d) const noexcept { return d.hash(); }
};
