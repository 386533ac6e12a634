#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../Concurrency/Priority.h"
#include "FileOperationHandle.h"

namespace AsyncFile::Core::IO {

class FileSystem;

/// Seek target with the three standard origins
class SeekFrom {
public:
    enum class Origin { Start, Current, End };

    static SeekFrom start(uint64_t offset) noexcept { return SeekFrom(Origin::Start, offset, 0); }
    static SeekFrom current(int64_t delta) noexcept { return SeekFrom(Origin::Current, 0, delta); }
    static SeekFrom end(int64_t delta) noexcept { return SeekFrom(Origin::End, 0, delta); }

    Origin origin() const noexcept { return _origin; }
    // Absolute offset for Origin::Start
    uint64_t startOffset() const noexcept { return _start; }
    // Signed delta for Origin::Current and Origin::End
    int64_t delta() const noexcept { return _delta; }

private:
    SeekFrom(Origin o, uint64_t start, int64_t delta) noexcept : _origin(o), _start(start), _delta(delta) {}

    Origin _origin;
    uint64_t _start;
    int64_t _delta;
};

// Applies a Current-relative delta; empty on a negative or 64-bit overflowing result
std::optional<uint64_t> applySeekDelta(uint64_t position, int64_t delta) noexcept;

struct BackendCapabilities {
    bool isRemote = false;
    bool supportsSeekFromEnd = true;
    bool reportsExactLength = true;    // metadata().length() equals the bytes a full read returns
    bool advancesCursorOnRead = true;
};

/**
 * One open file. Implementations allow at most one operation in flight; an
 * operation issued while another is pending completes immediately as Failed
 * with FileError::HandleBusy.
 */
class OpenFile {
public:
    virtual ~OpenFile() = default;

    virtual FileOperationHandle read(size_t size, Concurrency::Priority priority) = 0;
    virtual FileOperationHandle seek(SeekFrom position, Concurrency::Priority priority) = 0;
    virtual FileOperationHandle metadata(Concurrency::Priority priority) = 0;
    // metadata() followed by read() of that length, as one operation
    virtual FileOperationHandle readAll(Concurrency::Priority priority) = 0;

    virtual const std::string& path() const noexcept = 0;
    virtual bool busy() const noexcept = 0;
    virtual std::string backendType() const = 0;
};

class IFileBackend {
public:
    virtual ~IFileBackend() = default;

    // Completes with file() set on success
    virtual FileOperationHandle open(const std::string& path, Concurrency::Priority priority) = 0;
    // Never fails; completes with exists() set
    virtual FileOperationHandle exists(const std::string& path, Concurrency::Priority priority) = 0;
    // open() then OpenFile::readAll() on a fresh handle, run as a single operation
    virtual FileOperationHandle readAll(const std::string& path, Concurrency::Priority priority) = 0;

    virtual BackendCapabilities getCapabilities() const = 0;
    virtual std::string getBackendType() const = 0;

    // Set by FileSystem when the backend is attached
    virtual void setFileSystem(FileSystem* fs) { _fs = fs; }

protected:
    FileSystem* _fs = nullptr;
};

} // namespace AsyncFile::Core::IO
