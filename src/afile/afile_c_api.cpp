/**
 * @file afile_c_api.cpp
 * @brief Status strings, version and buffer ownership for the C API
 */

#include "afile/afile_c_api.h"
#include <cstdlib>

#ifndef ASYNCFILECORE_VERSION_MAJOR
#define ASYNCFILECORE_VERSION_MAJOR 1
#define ASYNCFILECORE_VERSION_MINOR 0
#define ASYNCFILECORE_VERSION_PATCH 0
#endif

extern "C" {

AFILE_API void afile_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch) {
    if (major) *major = ASYNCFILECORE_VERSION_MAJOR;
    if (minor) *minor = ASYNCFILECORE_VERSION_MINOR;
    if (patch) *patch = ASYNCFILECORE_VERSION_PATCH;
}

AFILE_API const char* afile_status_to_string(AfileStatus s) {
    switch (s) {
        case AFILE_OK:
            return "AFILE_OK";
        case AFILE_ERR_UNKNOWN:
            return "AFILE_ERR_UNKNOWN";
        case AFILE_ERR_INVALID_ARG:
            return "AFILE_ERR_INVALID_ARG";
        case AFILE_ERR_NOT_FOUND:
            return "AFILE_ERR_NOT_FOUND";
        case AFILE_ERR_NO_MEMORY:
            return "AFILE_ERR_NO_MEMORY";
        case AFILE_ERR_UNAVAILABLE:
            return "AFILE_ERR_UNAVAILABLE";
        default:
            return "AFILE_STATUS_UNKNOWN";
    }
}

AFILE_API void afile_buffer_dispose(AfileOwnedBuffer b) {
    std::free(b.ptr);
}

} // extern "C"
