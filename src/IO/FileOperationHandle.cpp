#include "FileOperationHandle.h"
#include "FileHandle.h"
#include <chrono>

namespace AsyncFile::Core::IO {

const char* toString(FileError error) noexcept {
    switch (error) {
        case FileError::None: return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::InvalidPath: return "InvalidPath";
        case FileError::IOError: return "IOError";
        case FileError::NetworkError: return "NetworkError";
        case FileError::HttpStatus: return "HttpStatus";
        case FileError::NoBody: return "NoBody";
        case FileError::InvalidLength: return "InvalidLength";
        case FileError::SeekOverflow: return "SeekOverflow";
        case FileError::Unsupported: return "Unsupported";
        case FileError::HandleBusy: return "HandleBusy";
        case FileError::Configuration: return "Configuration";
        case FileError::Cancelled: return "Cancelled";
        case FileError::Unknown: return "Unknown";
    }
    return "Unknown";
}

FileOperationHandle::PendingGuard::~PendingGuard() {
    body = nullptr;
    if (state) {
        state->fail(FileError::Cancelled, "Operation cancelled before it ran", state->error.path);
    }
}

void FileOperationHandle::wait() const {
    if (!_s) return;

    // Fast path - already complete
    if (_s->isComplete.load(std::memory_order_acquire)) {
        return;
    }

    // Slow path - wait for completion with cooperative progress pumping
    std::unique_lock<std::mutex> lock(_s->completionMutex);
    while (!_s->isComplete.load(std::memory_order_acquire)) {
        lock.unlock();
        if (_s->progress) {
            _s->progress();
        }
        lock.lock();
        _s->completionCV.wait_for(lock, std::chrono::milliseconds(1), [this]{
            return _s->isComplete.load(std::memory_order_acquire);
        });
    }
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st.load(std::memory_order_acquire) : FileOpStatus::Pending;
}

bool FileOperationHandle::cancel() const {
    if (!_s || _s->isComplete.load(std::memory_order_acquire)) return false;

    Concurrency::WorkContractHandle contract;
    {
        std::lock_guard<std::mutex> lock(_s->completionMutex);
        contract = _s->contract;
    }
    if (!contract.owner()) return false;

    // Only a contract still waiting in the ready set can be withdrawn
    if (contract.unschedule() != Concurrency::ScheduleResult::NotScheduled) {
        return false;
    }
    // Destroying the closure returns any checked-out resource, then fails the operation
    contract.release();
    _s->fail(FileError::Cancelled, "Operation cancelled before it ran", _s->error.path);
    return true;
}

std::span<const std::byte> FileOperationHandle::contentsBytes() const {
    if (!_s) return {};
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->data.bytes();
}

std::string FileOperationHandle::contentsText() const {
    if (!_s) return {};
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->data.text();
}

const FileData& FileOperationHandle::data() const {
    static const FileData empty;
    if (!_s) return empty;
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->data;
}

FileData FileOperationHandle::takeData() const {
    if (!_s) return {};
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return std::move(_s->data);
}

uint64_t FileOperationHandle::position() const {
    if (!_s) return 0;
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->position;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    static const std::optional<FileMetadata> empty;
    if (!_s) return empty;
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->metadata;
}

FileHandle FileOperationHandle::file() const {
    if (!_s) return FileHandle();
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return FileHandle(_s->opened);
}

bool FileOperationHandle::exists() const {
    if (!_s) return false;
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->exists;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static FileErrorInfo emptyError;
    if (!_s) return emptyError;
    if (!_s->isComplete.load(std::memory_order_acquire)) {
        wait();
    }
    return _s->error;
}

FileOperationHandle FileOperationHandle::immediate(FileOpStatus status) {
    auto state = std::make_shared<OpState>();
    state->complete(status);
    return FileOperationHandle(state);
}

FileOperationHandle FileOperationHandle::failed(FileError code, std::string message, std::string path) {
    auto state = std::make_shared<OpState>();
    state->fail(code, std::move(message), std::move(path));
    return FileOperationHandle(state);
}

std::shared_ptr<FileOperationHandle::OpState> FileOperationHandle::makeState() {
    return std::make_shared<OpState>();
}

FileOperationHandle::FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

} // namespace AsyncFile::Core::IO
