#pragma once

/**
 * @file afile_file.h
 * @brief C API for opening and reading files through AsyncFile Core
 *
 * Every call that starts I/O returns an afile_Operation. Wait on it, inspect
 * its status and results, then destroy it. Only one operation may be pending
 * per afile_File; a second one fails with AFILE_FILE_ERROR_HANDLE_BUSY.
 *
 * @code
 * AfileFileSystemConfig cfg;
 * afile_file_system_config_init(&cfg);
 * AfileStatus st = AFILE_OK;
 * afile_FileSystem fs = afile_file_system_create(&cfg, &st);
 * afile_Operation op = afile_file_system_read_all(fs, "/etc/hostname", 128, &st);
 * afile_operation_wait(op, &st);
 * AfileOwnedBuffer buf;
 * afile_operation_take_buffer(op, &buf, &st);
 * afile_buffer_dispose(buf);
 * afile_operation_destroy(op);
 * afile_file_system_destroy(fs);
 * @endcode
 */

#include "afile/afile_io_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// File system ----------------------------------------------------------------
AFILE_API void afile_file_system_config_init(AfileFileSystemConfig* out_config);
AFILE_API afile_FileSystem afile_file_system_create(const AfileFileSystemConfig* config, AfileStatus* status);
AFILE_API void afile_file_system_destroy(afile_FileSystem fs);

AFILE_API afile_Operation afile_file_system_open(afile_FileSystem fs, const char* path, uint8_t priority,
                                                 AfileStatus* status);
AFILE_API afile_Operation afile_file_system_exists(afile_FileSystem fs, const char* path, uint8_t priority,
                                                   AfileStatus* status);
AFILE_API afile_Operation afile_file_system_read_all(afile_FileSystem fs, const char* path, uint8_t priority,
                                                     AfileStatus* status);

// Open file ------------------------------------------------------------------
AFILE_API afile_Operation afile_file_read(afile_File file, uint64_t size, uint8_t priority, AfileStatus* status);
// For AFILE_SEEK_START the offset must be non-negative
AFILE_API afile_Operation afile_file_seek(afile_File file, AfileSeekOrigin origin, int64_t offset,
                                          uint8_t priority, AfileStatus* status);
AFILE_API afile_Operation afile_file_metadata(afile_File file, uint8_t priority, AfileStatus* status);
AFILE_API afile_Operation afile_file_read_all(afile_File file, uint8_t priority, AfileStatus* status);
AFILE_API AfileBool afile_file_is_busy(afile_File file);
AFILE_API void afile_file_destroy(afile_File file);

// Operations -----------------------------------------------------------------
AFILE_API void afile_operation_wait(afile_Operation op, AfileStatus* status);
AFILE_API AfileFileOpStatus afile_operation_status(afile_Operation op);
AFILE_API AfileBool afile_operation_cancel(afile_Operation op);
AFILE_API void afile_operation_error_info(afile_Operation op, AfileFileErrorInfo* out_info, AfileStatus* status);

// Moves the read buffer out (one copy into malloc'd memory); dispose with afile_buffer_dispose
AFILE_API void afile_operation_take_buffer(afile_Operation op, AfileOwnedBuffer* out_buffer, AfileStatus* status);
AFILE_API uint64_t afile_operation_position(afile_Operation op, AfileStatus* status);
AFILE_API uint64_t afile_operation_length(afile_Operation op, AfileStatus* status);
AFILE_API AfileBool afile_operation_exists(afile_Operation op, AfileStatus* status);
// Returns the opened file of a successful open; NULL otherwise
AFILE_API afile_File afile_operation_take_file(afile_Operation op, AfileStatus* status);
AFILE_API void afile_operation_destroy(afile_Operation op);

#ifdef __cplusplus
} // extern "C"
#endif
