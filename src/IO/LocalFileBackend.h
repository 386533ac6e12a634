#pragma once
#include <atomic>
#include <memory>
#include <string>

#include "ExclusiveSlot.h"
#include "IFileBackend.h"

namespace AsyncFile::Core::IO {

// Owning POSIX file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : _fd(fd) {}
    ~UniqueFd();

    UniqueFd(UniqueFd&& other) noexcept : _fd(other._fd) { other._fd = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept;
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const noexcept { return _fd; }
    bool valid() const noexcept { return _fd >= 0; }

private:
    int _fd = -1;
};

/**
 * Backend over the local filesystem.
 *
 * Each operation runs its blocking syscall (open, read, lseek, fstat) on a
 * worker thread of the FileSystem's WorkContractGroup. This is a thread-pool
 * offload, not kernel asynchronous I/O.
 */
class LocalFileBackend : public IFileBackend {
public:
    LocalFileBackend() = default;

    FileOperationHandle open(const std::string& path, Concurrency::Priority priority) override;
    FileOperationHandle exists(const std::string& path, Concurrency::Priority priority) override;
    FileOperationHandle readAll(const std::string& path, Concurrency::Priority priority) override;

    BackendCapabilities getCapabilities() const override;
    std::string getBackendType() const override { return "Local"; }

private:
    void notePerformanceCaveat();

    std::atomic<bool> _caveatLogged{false};
};

/**
 * A descriptor opened by LocalFileBackend.
 *
 * The descriptor lives in an ExclusiveSlot. Every operation checks it out for
 * its whole duration, so at most one syscall touches it at a time and the
 * kernel file position advances exactly as with sequential blocking calls.
 */
class LocalOpenFile : public OpenFile {
public:
    LocalOpenFile(FileSystem* fs, std::string path, UniqueFd fd);

    FileOperationHandle read(size_t size, Concurrency::Priority priority) override;
    FileOperationHandle seek(SeekFrom position, Concurrency::Priority priority) override;
    FileOperationHandle metadata(Concurrency::Priority priority) override;
    FileOperationHandle readAll(Concurrency::Priority priority) override;

    const std::string& path() const noexcept override { return _path; }
    bool busy() const noexcept override { return _slot->busy(); }
    std::string backendType() const override { return "Local"; }

private:
    using Slot = ExclusiveSlot<UniqueFd>;

    // Checks the descriptor out and schedules body with the lease
    template <typename Fn>
    FileOperationHandle withDescriptor(Concurrency::Priority priority, Fn&& body);

    // Opens path read-only and rejects directories; an invalid UniqueFd means s holds the error
    static UniqueFd openReadOnly(const std::string& path, FileOperationHandle::OpState& s);
    static FileOpStatus readInto(int fd, size_t size, bool fill, const std::string& path,
                                 FileOperationHandle::OpState& s);
    // fstat for the length, then fill a buffer of that length
    static FileOpStatus readWhole(int fd, const std::string& path, FileOperationHandle::OpState& s);

    friend class LocalFileBackend;

    FileSystem* _fs;
    std::string _path;
    std::shared_ptr<Slot> _slot;
};

} // namespace AsyncFile::Core::IO
