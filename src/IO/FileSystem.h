/**
 * @file FileSystem.h
 * @brief Facade for asynchronous file access over a local or remote backend
 *
 * FileSystem picks its backend once, at construction: the local filesystem
 * (blocking syscalls offloaded to a WorkContractGroup) or a remote HTTP origin
 * (files emulated with HEAD and ranged GET requests). Every call returns a
 * FileOperationHandle that can be waited on; nothing blocks the calling thread
 * until wait() is called.
 *
 * The WorkContractGroup and the FileSystem must outlive every FileHandle and
 * FileOperationHandle obtained from it.
 *
 * @code
 * WorkService svc({});
 * WorkContractGroup group(256, "IO");
 * svc.start();
 * svc.addWorkContractGroup(&group);
 *
 * FileSystem fs(&group);
 * auto op = fs.open("/etc/hostname");
 * op.wait();
 * auto all = op.file().readAll(); all.wait();
 * AFILE_LOG_INFO(all.contentsText());
 * @endcode
 */
#pragma once
#include <memory>
#include <string>

#include "../Concurrency/Priority.h"
#include "../Concurrency/WorkContractGroup.h"
#include "FileHandle.h"
#include "FileOperationHandle.h"
#include "IFileBackend.h"
#include "RemoteFileBackend.h"

namespace AsyncFile::Core::IO {

class FileSystem {
public:
    enum class BackendKind { Local, Remote };

    struct Config {
        BackendKind backend;
        RemoteFileBackend::Config remote;  // used when backend == Remote

        Config() : backend(BackendKind::Local) {}
    };

    explicit FileSystem(Concurrency::WorkContractGroup* group, Config cfg = {});
    // Attaches a caller-supplied backend instead of one selected by Config
    FileSystem(Concurrency::WorkContractGroup* group, std::shared_ptr<IFileBackend> backend);
    ~FileSystem();

    FileSystem(const FileSystem&) = delete;
    FileSystem& operator=(const FileSystem&) = delete;

    /**
     * @brief Opens a file for reading
     *
     * Existence is resolved eagerly: a missing local file or a remote HEAD that
     * does not succeed fails the operation with FileError::FileNotFound.
     * @return Operation whose file() is the opened FileHandle on success
     */
    FileOperationHandle open(std::string path, Concurrency::Priority priority = Concurrency::Priority());

    /// Completes with exists() set; never fails
    FileOperationHandle exists(std::string path, Concurrency::Priority priority = Concurrency::Priority());

    /// Opens the file and reads its whole content as reported by its metadata, as one operation
    FileOperationHandle readAll(std::string path, Concurrency::Priority priority = Concurrency::Priority());

    const std::shared_ptr<IFileBackend>& backend() const noexcept { return _backend; }
    Concurrency::WorkContractGroup* group() const noexcept { return _group; }

    /**
     * @brief Schedules one operation body on the work group
     *
     * The body runs once on a worker thread and returns the final status. All
     * resources it captured are destroyed before the operation is marked
     * complete. If the body never runs (cancelled, group full or stopping), the
     * operation completes as Failed with FileError::Cancelled.
     */
    FileOperationHandle submit(std::string path, Concurrency::Priority priority,
                               FileOperationHandle::Body body) const;

private:
    Concurrency::WorkContractGroup* _group;
    Config _cfg;
    std::shared_ptr<IFileBackend> _backend;
};

} // namespace AsyncFile::Core::IO
