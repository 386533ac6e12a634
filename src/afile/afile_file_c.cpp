/**
 * @file afile_file_c.cpp
 * @brief Implementation of the file system, file and operation C API
 */

#include "afile/afile_file.h"
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkService.h"
#include "IO/FileSystem.h"
#include "Logging/Logger.h"
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

using namespace AsyncFile::Core;
using namespace AsyncFile::Core::IO;

/* ============================================================================
 * Opaque Types
 * ============================================================================ */

struct afile_FileSystem_t {
    std::unique_ptr<Concurrency::WorkService> service;
    std::unique_ptr<Concurrency::WorkContractGroup> group;
    std::unique_ptr<FileSystem> fs;

    ~afile_FileSystem_t() {
        if (service && group) {
            service->removeWorkContractGroup(group.get());
        }
        if (service) {
            service->stop();
        }
        // Unrun operations complete as Cancelled when the group drops them
        group.reset();
        fs.reset();
    }
};

struct afile_File_t {
    FileHandle handle;
};

struct afile_Operation_t {
    FileOperationHandle handle;
};

/* ============================================================================
 * Exception Translation
 * ============================================================================ */

static void translate_exception(AfileStatus* status) {
    try {
        throw;
    } catch (const std::bad_alloc&) {
        if (status) *status = AFILE_ERR_NO_MEMORY;
    } catch (const std::invalid_argument&) {
        if (status) *status = AFILE_ERR_INVALID_ARG;
    } catch (const std::exception& e) {
        AFILE_LOG_ERROR_CAT("CApi", std::string("Unhandled exception: ") + e.what());
        if (status) *status = AFILE_ERR_UNKNOWN;
    } catch (...) {
        if (status) *status = AFILE_ERR_UNKNOWN;
    }
}

/* ============================================================================
 * Helpers
 * ============================================================================ */

static afile_Operation wrap_operation(FileOperationHandle&& handle) {
    auto* op = new afile_Operation_t{};
    op->handle = std::move(handle);
    return op;
}

static bool check_arg(bool ok, AfileStatus* status) {
    if (!ok && status) *status = AFILE_ERR_INVALID_ARG;
    return ok;
}

static AfileFileOpStatus to_c_status(FileOpStatus s) {
    switch (s) {
        case FileOpStatus::Pending: return AFILE_OP_PENDING;
        case FileOpStatus::Running: return AFILE_OP_RUNNING;
        case FileOpStatus::Partial: return AFILE_OP_PARTIAL;
        case FileOpStatus::Complete: return AFILE_OP_COMPLETE;
        case FileOpStatus::Failed: return AFILE_OP_FAILED;
    }
    return AFILE_OP_FAILED;
}

/* ============================================================================
 * FileSystem Implementation
 * ============================================================================ */

extern "C" {

AFILE_API void afile_file_system_config_init(AfileFileSystemConfig* out_config) {
    if (!out_config) return;
    out_config->backend = AFILE_BACKEND_LOCAL;
    out_config->origin = nullptr;
    out_config->origin_env_var = nullptr;
    out_config->advance_cursor_on_read = AFILE_TRUE;
    out_config->worker_threads = 0;
    out_config->group_capacity = 256;
}

AFILE_API afile_FileSystem afile_file_system_create(const AfileFileSystemConfig* config, AfileStatus* status) {
    if (!check_arg(config != nullptr, status)) return nullptr;
    if (!check_arg(config->group_capacity > 0, status)) return nullptr;

    try {
        FileSystem::Config cfg;
        if (config->backend == AFILE_BACKEND_REMOTE) {
            cfg.backend = FileSystem::BackendKind::Remote;
            if (config->origin) cfg.remote.origin = std::string(config->origin);
            if (config->origin_env_var) cfg.remote.originEnvVar = config->origin_env_var;
            cfg.remote.advanceCursorOnRead = config->advance_cursor_on_read != AFILE_FALSE;
        } else if (config->backend != AFILE_BACKEND_LOCAL) {
            if (status) *status = AFILE_ERR_INVALID_ARG;
            return nullptr;
        }

        auto handle = std::make_unique<afile_FileSystem_t>();
        Concurrency::WorkService::Config svcCfg;
        svcCfg.threadCount = config->worker_threads;
        handle->service = std::make_unique<Concurrency::WorkService>(svcCfg);
        handle->group = std::make_unique<Concurrency::WorkContractGroup>(config->group_capacity, "CApiFileSystem");
        handle->fs = std::make_unique<FileSystem>(handle->group.get(), std::move(cfg));
        if (handle->service->addWorkContractGroup(handle->group.get()) !=
            Concurrency::WorkService::GroupOperationStatus::Added) {
            if (status) *status = AFILE_ERR_UNAVAILABLE;
            return nullptr;
        }
        handle->service->start();

        if (status) *status = AFILE_OK;
        return handle.release();
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API void afile_file_system_destroy(afile_FileSystem fs) {
    delete fs;
}

AFILE_API afile_Operation afile_file_system_open(afile_FileSystem fs, const char* path, uint8_t priority,
                                                 AfileStatus* status) {
    if (!check_arg(fs && path, status)) return nullptr;
    try {
        auto op = wrap_operation(fs->fs->open(path, Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API afile_Operation afile_file_system_exists(afile_FileSystem fs, const char* path, uint8_t priority,
                                                   AfileStatus* status) {
    if (!check_arg(fs && path, status)) return nullptr;
    try {
        auto op = wrap_operation(fs->fs->exists(path, Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API afile_Operation afile_file_system_read_all(afile_FileSystem fs, const char* path, uint8_t priority,
                                                     AfileStatus* status) {
    if (!check_arg(fs && path, status)) return nullptr;
    try {
        auto op = wrap_operation(fs->fs->readAll(path, Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

/* ============================================================================
 * File Implementation
 * ============================================================================ */

AFILE_API afile_Operation afile_file_read(afile_File file, uint64_t size, uint8_t priority, AfileStatus* status) {
    if (!check_arg(file != nullptr, status)) return nullptr;
    try {
        auto op = wrap_operation(file->handle.read(static_cast<size_t>(size), Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API afile_Operation afile_file_seek(afile_File file, AfileSeekOrigin origin, int64_t offset,
                                          uint8_t priority, AfileStatus* status) {
    if (!check_arg(file != nullptr, status)) return nullptr;

    SeekFrom target = SeekFrom::start(0);
    switch (origin) {
        case AFILE_SEEK_START:
            if (!check_arg(offset >= 0, status)) return nullptr;
            target = SeekFrom::start(static_cast<uint64_t>(offset));
            break;
        case AFILE_SEEK_CURRENT:
            target = SeekFrom::current(offset);
            break;
        case AFILE_SEEK_END:
            target = SeekFrom::end(offset);
            break;
        default:
            if (status) *status = AFILE_ERR_INVALID_ARG;
            return nullptr;
    }

    try {
        auto op = wrap_operation(file->handle.seek(target, Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API afile_Operation afile_file_metadata(afile_File file, uint8_t priority, AfileStatus* status) {
    if (!check_arg(file != nullptr, status)) return nullptr;
    try {
        auto op = wrap_operation(file->handle.metadata(Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API afile_Operation afile_file_read_all(afile_File file, uint8_t priority, AfileStatus* status) {
    if (!check_arg(file != nullptr, status)) return nullptr;
    try {
        auto op = wrap_operation(file->handle.readAll(Concurrency::Priority(priority)));
        if (status) *status = AFILE_OK;
        return op;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API AfileBool afile_file_is_busy(afile_File file) {
    if (!file) return AFILE_FALSE;
    return file->handle.busy() ? AFILE_TRUE : AFILE_FALSE;
}

AFILE_API void afile_file_destroy(afile_File file) {
    delete file;
}

/* ============================================================================
 * Operation Implementation
 * ============================================================================ */

AFILE_API void afile_operation_wait(afile_Operation op, AfileStatus* status) {
    if (!check_arg(op != nullptr, status)) return;
    try {
        op->handle.wait();
        if (status) *status = AFILE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

AFILE_API AfileFileOpStatus afile_operation_status(afile_Operation op) {
    if (!op) return AFILE_OP_FAILED;
    return to_c_status(op->handle.status());
}

AFILE_API AfileBool afile_operation_cancel(afile_Operation op) {
    if (!op) return AFILE_FALSE;
    try {
        return op->handle.cancel() ? AFILE_TRUE : AFILE_FALSE;
    } catch (const std::exception& e) {
        AFILE_LOG_ERROR_CAT("CApi", std::string("cancel failed: ") + e.what());
        return AFILE_FALSE;
    }
}

AFILE_API void afile_operation_error_info(afile_Operation op, AfileFileErrorInfo* out_info, AfileStatus* status) {
    if (!check_arg(op && out_info, status)) return;
    try {
        const FileErrorInfo& err = op->handle.errorInfo();
        out_info->code = static_cast<AfileFileError>(err.code);
        out_info->http_status = err.httpStatus.value_or(0);
        out_info->system_errno = err.systemError ? err.systemError->value() : 0;
        out_info->message = err.message.c_str();
        out_info->path = err.path.c_str();
        if (status) *status = AFILE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

AFILE_API void afile_operation_take_buffer(afile_Operation op, AfileOwnedBuffer* out_buffer, AfileStatus* status) {
    if (!check_arg(op && out_buffer, status)) return;
    out_buffer->ptr = nullptr;
    out_buffer->len = 0;
    try {
        auto bytes = op->handle.takeData().intoBytes();
        if (!bytes.empty()) {
            auto* mem = static_cast<uint8_t*>(std::malloc(bytes.size()));
            if (!mem) {
                if (status) *status = AFILE_ERR_NO_MEMORY;
                return;
            }
            std::memcpy(mem, bytes.data(), bytes.size());
            out_buffer->ptr = mem;
            out_buffer->len = static_cast<uint64_t>(bytes.size());
        }
        if (status) *status = AFILE_OK;
    } catch (...) {
        translate_exception(status);
    }
}

AFILE_API uint64_t afile_operation_position(afile_Operation op, AfileStatus* status) {
    if (!check_arg(op != nullptr, status)) return 0;
    try {
        uint64_t pos = op->handle.position();
        if (status) *status = AFILE_OK;
        return pos;
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

AFILE_API uint64_t afile_operation_length(afile_Operation op, AfileStatus* status) {
    if (!check_arg(op != nullptr, status)) return 0;
    try {
        const auto& meta = op->handle.metadata();
        if (!meta) {
            if (status) *status = AFILE_ERR_UNAVAILABLE;
            return 0;
        }
        if (status) *status = AFILE_OK;
        return meta->length();
    } catch (...) {
        translate_exception(status);
        return 0;
    }
}

AFILE_API AfileBool afile_operation_exists(afile_Operation op, AfileStatus* status) {
    if (!check_arg(op != nullptr, status)) return AFILE_FALSE;
    try {
        bool e = op->handle.exists();
        if (status) *status = AFILE_OK;
        return e ? AFILE_TRUE : AFILE_FALSE;
    } catch (...) {
        translate_exception(status);
        return AFILE_FALSE;
    }
}

AFILE_API afile_File afile_operation_take_file(afile_Operation op, AfileStatus* status) {
    if (!check_arg(op != nullptr, status)) return nullptr;
    try {
        FileHandle fh = op->handle.file();
        if (!fh.valid()) {
            if (status) *status = AFILE_ERR_UNAVAILABLE;
            return nullptr;
        }
        auto* file = new afile_File_t{std::move(fh)};
        if (status) *status = AFILE_OK;
        return file;
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

AFILE_API void afile_operation_destroy(afile_Operation op) {
    delete op;
}

} // extern "C"
