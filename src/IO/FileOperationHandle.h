#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "../Concurrency/WorkContractHandle.h"
#include "FileData.h"

namespace AsyncFile::Core::IO {

class FileHandle;
class OpenFile;

enum class FileOpStatus { Pending, Running, Partial, Complete, Failed };

/**
 * Error taxonomy surfaced by file operations.
 * Mapping guidelines:
 * - FileNotFound: open of a missing local path, or remote HEAD reporting absence
 * - AccessDenied / InvalidPath: local open refused or malformed path
 * - IOError: any other local syscall failure; errno kept in systemError
 * - NetworkError: transport failure before an HTTP status was received
 * - HttpStatus: response status outside 2xx; status kept in httpStatus
 * - NoBody: response carried no body where one was required
 * - InvalidLength: Content-Length missing or not a non-negative integer
 * - SeekOverflow: seek result would be negative or exceed 64 bits
 * - Unsupported: operation the backend cannot perform (remote seek from End)
 * - HandleBusy: another operation on the same handle has not finished
 * - Configuration: remote origin could not be resolved
 * - Cancelled: operation was cancelled or dropped before it ran
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    InvalidPath,
    IOError,
    NetworkError,
    HttpStatus,
    NoBody,
    InvalidLength,
    SeekOverflow,
    Unsupported,
    HandleBusy,
    Configuration,
    Cancelled,
    Unknown
};

const char* toString(FileError error) noexcept;

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
    std::optional<int> httpStatus;
};

// File metadata - defined here so OpState can use it
class FileMetadata {
public:
    explicit FileMetadata(uint64_t length) noexcept : _length(length) {}

    uint64_t length() const noexcept { return _length; }

    friend bool operator==(const FileMetadata&, const FileMetadata&) noexcept = default;

private:
    uint64_t _length = 0;
};

class FileOperationHandle {
public:
    FileOperationHandle() = default;

    // Blocks until the operation completes, running ready background work meanwhile
    void wait() const;
    FileOpStatus status() const noexcept;
    bool valid() const noexcept { return static_cast<bool>(_s); }

    /**
     * Withdraws the operation if no thread has started it yet.
     * On success the operation completes as Failed with FileError::Cancelled and
     * the handle it was issued on becomes usable again. Returns false when the
     * operation is already running or finished; it then completes normally.
     */
    bool cancel() const;

    // Read results - only valid after wait()
    std::span<const std::byte> contentsBytes() const;
    std::string contentsText() const;
    const FileData& data() const;
    // Moves the buffer out of the handle; later calls see an empty buffer
    FileData takeData() const;

    // Seek results - absolute offset after the seek
    uint64_t position() const;

    // Metadata results - only valid after wait()
    const std::optional<FileMetadata>& metadata() const;

    // Open results - an invalid FileHandle unless the open succeeded
    FileHandle file() const;

    // Existence check results
    bool exists() const;

    // Error information - only valid after wait() and status is Failed
    const FileErrorInfo& errorInfo() const;

    // Factories for operations that complete without scheduling
    static FileOperationHandle immediate(FileOpStatus status);
    static FileOperationHandle failed(FileError code, std::string message, std::string path = {});

private:
    struct OpState {
        std::atomic<FileOpStatus> st{FileOpStatus::Pending};
        mutable std::mutex completionMutex;
        mutable std::condition_variable completionCV;
        std::atomic<bool> isComplete{false};

        // Optional progress hook called by wait() to ensure forward progress
        std::function<void()> progress;
        // Contract scheduled to run this operation
        Concurrency::WorkContractHandle contract;

        // Result data - only valid after completion
        FileData data;                           // for reads
        uint64_t position = 0;                   // for seeks
        std::optional<FileMetadata> metadata;    // for metadata queries
        std::shared_ptr<OpenFile> opened;        // for open
        bool exists = false;                     // for existence checks
        FileErrorInfo error;                     // error details if failed

        // First call wins; later calls are ignored
        bool complete(FileOpStatus final) noexcept {
            {
                std::lock_guard<std::mutex> lock(completionMutex);
                if (isComplete.load(std::memory_order_acquire)) return false;
                st.store(final, std::memory_order_release);
                isComplete.store(true, std::memory_order_release);
            }
            completionCV.notify_all();
            return true;
        }

        void setError(FileError code, std::string msg,
                      std::string path = "",
                      std::optional<std::error_code> ec = std::nullopt,
                      std::optional<int> httpStatus = std::nullopt) {
            error.code = code;
            error.message = std::move(msg);
            error.path = std::move(path);
            error.systemError = ec;
            error.httpStatus = httpStatus;
        }

        void fail(FileError code, std::string msg, std::string path = "",
                  std::optional<std::error_code> ec = std::nullopt,
                  std::optional<int> httpStatus = std::nullopt) {
            if (isComplete.load(std::memory_order_acquire)) return;
            setError(code, std::move(msg), std::move(path), ec, httpStatus);
            complete(FileOpStatus::Failed);
        }
    };

    // Work body of one operation; runs at most once and returns the final status
    using Body = std::function<FileOpStatus(OpState&)>;

    // Owned by a scheduled closure. If the closure is destroyed without having
    // run, the body (and every resource it captured) is destroyed first and the
    // operation then completes as Cancelled.
    struct PendingGuard {
        std::shared_ptr<OpState> state;
        Body body;
        PendingGuard(std::shared_ptr<OpState> s, Body b) : state(std::move(s)), body(std::move(b)) {}
        ~PendingGuard();
        PendingGuard(const PendingGuard&) = delete;
        PendingGuard& operator=(const PendingGuard&) = delete;
    };

    std::shared_ptr<OpState> _s;
    explicit FileOperationHandle(std::shared_ptr<OpState> s);

    static std::shared_ptr<OpState> makeState();

    friend class FileSystem;
    friend class FileHandle;
    friend class LocalFileBackend;
    friend class LocalOpenFile;
    friend class RemoteFileBackend;
    friend class RemoteOpenFile;
};

} // namespace AsyncFile::Core::IO
