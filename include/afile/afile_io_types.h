#pragma once

// C types shared by the AsyncFile Core file API

#include "afile/afile_c_api.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct afile_FileSystem_t* afile_FileSystem;   // owns its worker pool
typedef struct afile_File_t* afile_File;               // one open file
typedef struct afile_Operation_t* afile_Operation;     // pending or finished operation

typedef enum AfileBackendKind {
    AFILE_BACKEND_LOCAL = 0,
    AFILE_BACKEND_REMOTE = 1
} AfileBackendKind;

typedef enum AfileFileOpStatus {
    AFILE_OP_PENDING = 0,
    AFILE_OP_RUNNING = 1,
    AFILE_OP_PARTIAL = 2,
    AFILE_OP_COMPLETE = 3,
    AFILE_OP_FAILED = 4
} AfileFileOpStatus;

// Values match AsyncFile::Core::IO::FileError
typedef enum AfileFileError {
    AFILE_FILE_ERROR_NONE = 0,
    AFILE_FILE_ERROR_NOT_FOUND = 1,
    AFILE_FILE_ERROR_ACCESS_DENIED = 2,
    AFILE_FILE_ERROR_INVALID_PATH = 3,
    AFILE_FILE_ERROR_IO = 4,
    AFILE_FILE_ERROR_NETWORK = 5,
    AFILE_FILE_ERROR_HTTP_STATUS = 6,
    AFILE_FILE_ERROR_NO_BODY = 7,
    AFILE_FILE_ERROR_INVALID_LENGTH = 8,
    AFILE_FILE_ERROR_SEEK_OVERFLOW = 9,
    AFILE_FILE_ERROR_UNSUPPORTED = 10,
    AFILE_FILE_ERROR_HANDLE_BUSY = 11,
    AFILE_FILE_ERROR_CONFIGURATION = 12,
    AFILE_FILE_ERROR_CANCELLED = 13,
    AFILE_FILE_ERROR_UNKNOWN = 14
} AfileFileError;

typedef enum AfileSeekOrigin {
    AFILE_SEEK_START = 0,
    AFILE_SEEK_CURRENT = 1,
    AFILE_SEEK_END = 2
} AfileSeekOrigin;

typedef struct AfileFileSystemConfig {
    AfileBackendKind backend;
    const char* origin;                // remote fallback origin, may be NULL
    const char* origin_env_var;        // NULL keeps the default, "" disables the lookup
    AfileBool advance_cursor_on_read;
    uint32_t worker_threads;           // 0 = hardware concurrency
    uint32_t group_capacity;           // maximum operations in flight
} AfileFileSystemConfig;

// Borrowed view of an operation's error; strings live as long as the operation
typedef struct AfileFileErrorInfo {
    AfileFileError code;
    int32_t http_status;   // 0 when not applicable
    int32_t system_errno;  // 0 when not applicable
    const char* message;
    const char* path;
} AfileFileErrorInfo;

#ifdef __cplusplus
} // extern "C"
#endif
