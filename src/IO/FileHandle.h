/**
 * @file FileHandle.h
 * @brief Copyable handle to one open file, local or remote
 *
 * FileHandle is obtained from FileSystem::open() and forwards each call to the
 * backend that opened it. All copies share the same open file and therefore
 * the same position and the same single-operation limit: issue the next call
 * only after the previous FileOperationHandle has completed, otherwise the new
 * call completes immediately with FileError::HandleBusy.
 *
 * @code
 * auto op = fs.open("assets/level.bin");
 * op.wait();
 * FileHandle fh = op.file();
 * fh.seek(SeekFrom::start(1024)).wait();
 * auto r = fh.read(256); r.wait();
 * @endcode
 */
#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "../Concurrency/Priority.h"
#include "FileOperationHandle.h"
#include "IFileBackend.h"

namespace AsyncFile::Core::IO {

class FileHandle {
public:
    FileHandle() = default;

    bool valid() const noexcept { return static_cast<bool>(_file); }

    FileOperationHandle read(size_t size, Concurrency::Priority priority = Concurrency::Priority()) const;
    FileOperationHandle seek(SeekFrom position, Concurrency::Priority priority = Concurrency::Priority()) const;
    FileOperationHandle metadata(Concurrency::Priority priority = Concurrency::Priority()) const;
    FileOperationHandle readAll(Concurrency::Priority priority = Concurrency::Priority()) const;

    const std::string& path() const noexcept;
    std::string backendType() const;
    // True while an operation issued on this file has not completed
    bool busy() const noexcept;

    friend bool operator==(const FileHandle& a, const FileHandle& b) noexcept { return a._file == b._file; }

private:
    explicit FileHandle(std::shared_ptr<OpenFile> file) : _file(std::move(file)) {}

    std::shared_ptr<OpenFile> _file;

    friend class FileOperationHandle;
};

} // namespace AsyncFile::Core::IO
