#pragma once

// C ABI for FerryCore
// This header is C-compatible and can be consumed by C, Rust, C#, etc.

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(FERRYCORE_SHARED)
    #if defined(FERRYCORE_BUILDING)
      #define FERRY_API __declspec(dllexport)
    #else
      #define FERRY_API __declspec(dllimport)
    #endif
  #else
    #define FERRY_API
  #endif
#else
  #if defined(FERRYCORE_SHARED)
    #define FERRY_API __attribute__((visibility("default")))
  #else
    #define FERRY_API
  #endif
#endif

// Status codes for C API functions
typedef enum FerryStatus {
    FERRY_OK = 0,
    FERRY_ERR_UNKNOWN = 1,
    FERRY_ERR_INVALID_ARG = 2,
    FERRY_ERR_NOT_FOUND = 3,
    FERRY_ERR_BUFFER_TOO_SMALL = 4,
    FERRY_ERR_NO_MEMORY = 5,
    FERRY_ERR_UNAVAILABLE = 6
} FerryStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t FerryBool; // 0 = false, non-zero = true
#define FERRY_FALSE 0
#define FERRY_TRUE  1

// Owned string (UTF-8). Caller must dispose via ferry_string_dispose.
typedef struct FerryOwnedString {
    const char* ptr;
    uint32_t    len;
} FerryOwnedString;

// Library/version/memory -----------------------------------------------------
FERRY_API void  ferry_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi);
FERRY_API void* ferry_alloc(size_t size);
FERRY_API void  ferry_free(void* p);

// Convenience/diagnostics ----------------------------------------------------
FERRY_API const char* ferry_status_to_string(FerryStatus s); // static string, no free
FERRY_API void        ferry_string_dispose(FerryOwnedString s);

// Message of the last failed call on this thread ("" if none). Borrowed, valid until the
// next failing call on the same thread.
FERRY_API const char* ferry_last_error_message(void);

#ifdef __cplusplus
} // extern "C"
#endif
