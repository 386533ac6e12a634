#include "FileSystem.h"

#include <exception>

#include "../Logging/Logger.h"
#include "LocalFileBackend.h"

namespace AsyncFile::Core::IO {

using Concurrency::ExecutionType;
using Concurrency::Priority;

namespace {
    std::shared_ptr<IFileBackend> makeBackend(const FileSystem::Config& cfg) {
        if (cfg.backend == FileSystem::BackendKind::Remote) {
            return std::make_shared<RemoteFileBackend>(cfg.remote);
        }
        return std::make_shared<LocalFileBackend>();
    }
}

FileSystem::FileSystem(Concurrency::WorkContractGroup* group, Config cfg)
    : _group(group), _cfg(std::move(cfg)), _backend(makeBackend(_cfg)) {
    _backend->setFileSystem(this);
}

FileSystem::FileSystem(Concurrency::WorkContractGroup* group, std::shared_ptr<IFileBackend> backend)
    : _group(group), _backend(std::move(backend)) {
    if (!_backend) {
        _backend = makeBackend(_cfg);
    }
    _backend->setFileSystem(this);
}

FileSystem::~FileSystem() {
    if (_backend) {
        _backend->setFileSystem(nullptr);
    }
}

FileOperationHandle FileSystem::open(std::string path, Priority priority) {
    return _backend->open(path, priority);
}

FileOperationHandle FileSystem::exists(std::string path, Priority priority) {
    return _backend->exists(path, priority);
}

FileOperationHandle FileSystem::readAll(std::string path, Priority priority) {
    return _backend->readAll(path, priority);
}

FileOperationHandle FileSystem::submit(std::string path, Priority priority, FileOperationHandle::Body body) const {
    auto st = FileOperationHandle::makeState();
    st->error.path = path;
    if (!_group) {
        st->fail(FileError::Configuration, "FileSystem has no WorkContractGroup", path);
        return FileOperationHandle(std::move(st));
    }
    // Cooperative progress hook so wait() can pump ready work
    st->progress = [grp = _group]() { grp->executeAllBackgroundWork(); };

    auto pending = std::make_shared<FileOperationHandle::PendingGuard>(st, std::move(body));
    auto work = [pending, p = path]() {
        auto& s = *pending->state;
        FileOperationHandle::Body fn = std::move(pending->body);
        pending->body = nullptr;

        s.st.store(FileOpStatus::Running, std::memory_order_release);
        FileOpStatus final = FileOpStatus::Failed;
        try {
            final = fn(s);
        } catch (const std::exception& e) {
            s.setError(FileError::Unknown, std::string("Unhandled exception in file operation: ") + e.what(), p);
            final = FileOpStatus::Failed;
        }
        // Release captured resources (checked-out descriptors, cursors) before publishing
        fn = nullptr;
        s.complete(final);
    };

    auto handle = _group->createContract(std::move(work), ExecutionType::AnyThread, priority);
    if (!handle.valid()) {
        AFILE_LOG_WARNING_CAT("FileSystem", "Work group '" + _group->name() + "' is full or stopping; rejecting operation on " + path);
        // Dropping the last reference destroys the body and fails the operation
        pending.reset();
        return FileOperationHandle(std::move(st));
    }
    {
        std::lock_guard<std::mutex> lock(st->completionMutex);
        st->contract = handle;
    }
    if (handle.schedule() != Concurrency::ScheduleResult::Scheduled) {
        handle.release();
    }
    return FileOperationHandle(std::move(st));
}

} // namespace AsyncFile::Core::IO
