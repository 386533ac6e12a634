#include "LocalFileBackend.h"
#include "FileHandle.h"
#include "FileSystem.h"

#include <cerrno>
#include <limits>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "../Logging/Logger.h"

namespace AsyncFile::Core::IO {

using Concurrency::Priority;

namespace {
    // Error mapping for open(); later syscalls report IOError directly
    FileError mapErrnoToFileError(int err) {
        switch (err) {
            case ENOENT:
            case ENOTDIR:
                return FileError::FileNotFound;
            case EACCES:
            case EPERM:
                return FileError::AccessDenied;
            case EISDIR:
            case ENAMETOOLONG:
                return FileError::InvalidPath;
            default:
                return FileError::IOError;
        }
    }

    std::error_code errnoCode(int err) {
        return std::error_code(err, std::generic_category());
    }
}

// Opens path read-only and rejects directories; an invalid UniqueFd means s holds the error
UniqueFd LocalOpenFile::openReadOnly(const std::string& path, FileOperationHandle::OpState& s) {
    int fd;
    do {
        fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
        const int err = errno;
        s.setError(mapErrnoToFileError(err), "Cannot open file: " + errnoCode(err).message(), path, errnoCode(err));
        return UniqueFd();
    }
    UniqueFd owned(fd);

    struct stat st{};
    if (::fstat(owned.get(), &st) != 0) {
        const int err = errno;
        s.setError(FileError::IOError, "fstat failed: " + errnoCode(err).message(), path, errnoCode(err));
        return UniqueFd();
    }
    if (S_ISDIR(st.st_mode)) {
        s.setError(FileError::InvalidPath, "Path is a directory", path, errnoCode(EISDIR));
        return UniqueFd();
    }
    return owned;
}

FileOpStatus LocalOpenFile::readInto(int fd, size_t size, bool fill, const std::string& path,
                                     FileOperationHandle::OpState& s) {
    // The buffer is owned here until the syscall has returned
    std::vector<std::byte> buffer(size);
    size_t total = 0;
    while (total < size) {
        ssize_t n = ::read(fd, buffer.data() + total, size - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            s.setError(FileError::IOError, "read failed: " + errnoCode(err).message(), path, errnoCode(err));
            return FileOpStatus::Failed;
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
        if (!fill) break;
    }
    buffer.resize(total);
    s.data = FileData(std::move(buffer));
    return total < size ? FileOpStatus::Partial : FileOpStatus::Complete;
}

// fstat for the length, then fill a buffer of that length
FileOpStatus LocalOpenFile::readWhole(int fd, const std::string& path, FileOperationHandle::OpState& s) {
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int err = errno;
        s.setError(FileError::IOError, "fstat failed: " + errnoCode(err).message(), path, errnoCode(err));
        return FileOpStatus::Failed;
    }
    s.metadata = FileMetadata(static_cast<uint64_t>(st.st_size));
    return readInto(fd, static_cast<size_t>(st.st_size), true, path, s);
}

UniqueFd::~UniqueFd() {
    if (_fd >= 0) {
        ::close(_fd);
    }
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        if (_fd >= 0) ::close(_fd);
        _fd = other._fd;
        other._fd = -1;
    }
    return *this;
}

void LocalFileBackend::notePerformanceCaveat() {
    if (!_caveatLogged.exchange(true, std::memory_order_acq_rel)) {
        AFILE_LOG_DEBUG_CAT("LocalFileBackend",
                            "Local file operations run blocking syscalls on worker threads");
    }
}

BackendCapabilities LocalFileBackend::getCapabilities() const {
    BackendCapabilities caps;
    caps.isRemote = false;
    caps.supportsSeekFromEnd = true;
    caps.reportsExactLength = true;
    caps.advancesCursorOnRead = true;
    return caps;
}

FileOperationHandle LocalFileBackend::open(const std::string& path, Priority priority) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "Backend is not attached to a FileSystem", path);
    }
    notePerformanceCaveat();
    FileSystem* fs = _fs;
    return _fs->submit(path, priority, [fs, path](FileOperationHandle::OpState& s) {
        UniqueFd owned = LocalOpenFile::openReadOnly(path, s);
        if (!owned.valid()) return FileOpStatus::Failed;
        s.opened = std::make_shared<LocalOpenFile>(fs, path, std::move(owned));
        return FileOpStatus::Complete;
    });
}

FileOperationHandle LocalFileBackend::exists(const std::string& path, Priority priority) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "Backend is not attached to a FileSystem", path);
    }
    return _fs->submit(path, priority, [path](FileOperationHandle::OpState& s) {
        struct stat st{};
        s.exists = (::stat(path.c_str(), &st) == 0);
        return FileOpStatus::Complete;
    });
}

FileOperationHandle LocalFileBackend::readAll(const std::string& path, Priority priority) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "Backend is not attached to a FileSystem", path);
    }
    notePerformanceCaveat();
    // The descriptor never leaves this body, so no handle is published
    return _fs->submit(path, priority, [path](FileOperationHandle::OpState& s) {
        UniqueFd owned = LocalOpenFile::openReadOnly(path, s);
        if (!owned.valid()) return FileOpStatus::Failed;
        return LocalOpenFile::readWhole(owned.get(), path, s);
    });
}

LocalOpenFile::LocalOpenFile(FileSystem* fs, std::string path, UniqueFd fd)
    : _fs(fs), _path(std::move(path)), _slot(Slot::create(std::move(fd))) {}

template <typename Fn>
FileOperationHandle LocalOpenFile::withDescriptor(Priority priority, Fn&& body) {
    if (!_fs) {
        return FileOperationHandle::failed(FileError::Configuration, "File is not attached to a FileSystem", _path);
    }
    auto lease = _slot->tryCheckOut();
    if (!lease) {
        return FileOperationHandle::failed(FileError::HandleBusy,
                                           "Another operation is still in flight on this file", _path);
    }
    // Shared so the closure stays copyable; the lease returns the descriptor if the closure never runs
    auto held = std::make_shared<Slot::Lease>(std::move(*lease));
    return _fs->submit(_path, priority,
                       [held, path = _path, body = std::forward<Fn>(body)](FileOperationHandle::OpState& s) mutable {
        Slot::Lease fd = std::move(*held);
        return body(fd->get(), path, s);
    });
}

FileOperationHandle LocalOpenFile::read(size_t size, Priority priority) {
    return withDescriptor(priority, [size](int fd, const std::string& path, FileOperationHandle::OpState& s) {
        return readInto(fd, size, false, path, s);
    });
}

FileOperationHandle LocalOpenFile::seek(SeekFrom position, Priority priority) {
    return withDescriptor(priority, [position](int fd, const std::string& path, FileOperationHandle::OpState& s) {
        off_t offset = 0;
        int whence = SEEK_SET;
        switch (position.origin()) {
            case SeekFrom::Origin::Start:
                if (position.startOffset() > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
                    s.setError(FileError::SeekOverflow, "Seek offset exceeds the platform file offset range", path);
                    return FileOpStatus::Failed;
                }
                offset = static_cast<off_t>(position.startOffset());
                whence = SEEK_SET;
                break;
            case SeekFrom::Origin::Current:
                offset = static_cast<off_t>(position.delta());
                whence = SEEK_CUR;
                break;
            case SeekFrom::Origin::End:
                offset = static_cast<off_t>(position.delta());
                whence = SEEK_END;
                break;
        }

        off_t result = ::lseek(fd, offset, whence);
        if (result < 0) {
            const int err = errno;
            // lseek leaves the position untouched on failure
            const FileError code = (err == EINVAL || err == EOVERFLOW) ? FileError::SeekOverflow : FileError::IOError;
            s.setError(code, "lseek failed: " + errnoCode(err).message(), path, errnoCode(err));
            return FileOpStatus::Failed;
        }
        s.position = static_cast<uint64_t>(result);
        return FileOpStatus::Complete;
    });
}

FileOperationHandle LocalOpenFile::metadata(Priority priority) {
    return withDescriptor(priority, [](int fd, const std::string& path, FileOperationHandle::OpState& s) {
        struct stat st{};
        if (::fstat(fd, &st) != 0) {
            const int err = errno;
            s.setError(FileError::IOError, "fstat failed: " + errnoCode(err).message(), path, errnoCode(err));
            return FileOpStatus::Failed;
        }
        s.metadata = FileMetadata(static_cast<uint64_t>(st.st_size));
        return FileOpStatus::Complete;
    });
}

FileOperationHandle LocalOpenFile::readAll(Priority priority) {
    return withDescriptor(priority, [](int fd, const std::string& path, FileOperationHandle::OpState& s) {
        return readWhole(fd, path, s);
    });
}

} // namespace AsyncFile::Core::IO
