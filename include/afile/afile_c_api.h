#pragma once

// C ABI for AsyncFile Core
// This header is C-compatible and can be consumed by C, Rust, C#, etc.

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(ASYNCFILECORE_SHARED)
    #if defined(ASYNCFILECORE_BUILDING)
      #define AFILE_API __declspec(dllexport)
    #else
      #define AFILE_API __declspec(dllimport)
    #endif
  #else
    #define AFILE_API
  #endif
#else
  #if defined(ASYNCFILECORE_SHARED)
    #define AFILE_API __attribute__((visibility("default")))
  #else
    #define AFILE_API
  #endif
#endif

// Status codes for C API functions
typedef enum AfileStatus {
    AFILE_OK = 0,
    AFILE_ERR_UNKNOWN = 1,
    AFILE_ERR_INVALID_ARG = 2,
    AFILE_ERR_NOT_FOUND = 3,
    AFILE_ERR_NO_MEMORY = 4,
    AFILE_ERR_UNAVAILABLE = 5
} AfileStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t AfileBool; // 0 = false, non-zero = true
#define AFILE_FALSE 0
#define AFILE_TRUE  1

// Owned buffer (bytes). Caller must dispose via afile_buffer_dispose.
typedef struct AfileOwnedBuffer {
    uint8_t* ptr;
    uint64_t len;
} AfileOwnedBuffer;

AFILE_API void afile_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch);
AFILE_API const char* afile_status_to_string(AfileStatus s); // static string, no free
AFILE_API void afile_buffer_dispose(AfileOwnedBuffer b);

#ifdef __cplusplus
} // extern "C"
#endif
