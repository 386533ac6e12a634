#include "FileHandle.h"

#include <limits>

namespace AsyncFile::Core::IO {

namespace {
    FileOperationHandle invalidHandle() {
        return FileOperationHandle::failed(FileError::InvalidPath, "Operation on an invalid FileHandle");
    }
}

std::optional<uint64_t> applySeekDelta(uint64_t position, int64_t delta) noexcept {
    if (delta >= 0) {
        const auto d = static_cast<uint64_t>(delta);
        if (d > std::numeric_limits<uint64_t>::max() - position) return std::nullopt;
        return position + d;
    }
    // Magnitude of a negative int64 fits in uint64 without overflow
    const uint64_t magnitude = static_cast<uint64_t>(-(delta + 1)) + 1;
    if (magnitude > position) return std::nullopt;
    return position - magnitude;
}

FileOperationHandle FileHandle::read(size_t size, Concurrency::Priority priority) const {
    if (!_file) return invalidHandle();
    return _file->read(size, priority);
}

FileOperationHandle FileHandle::seek(SeekFrom position, Concurrency::Priority priority) const {
    if (!_file) return invalidHandle();
    return _file->seek(position, priority);
}

FileOperationHandle FileHandle::metadata(Concurrency::Priority priority) const {
    if (!_file) return invalidHandle();
    return _file->metadata(priority);
}

FileOperationHandle FileHandle::readAll(Concurrency::Priority priority) const {
    if (!_file) return invalidHandle();
    return _file->readAll(priority);
}

const std::string& FileHandle::path() const noexcept {
    static const std::string empty;
    return _file ? _file->path() : empty;
}

std::string FileHandle::backendType() const {
    return _file ? _file->backendType() : std::string();
}

bool FileHandle::busy() const noexcept {
    return _file && _file->busy();
}

} // namespace AsyncFile::Core::IO
