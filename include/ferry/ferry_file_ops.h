#pragma once

/**
 * @file ferry_file_ops.h
 * @brief C API for transfers, hashing and traversal
 *
 * Every call reports through a required FerryStatus out-parameter. File failures use the
 * FERRY_ERR_FILE_* codes below; the matching FerryFileError and a message for the last
 * failure on the calling thread are available from ferry_last_file_error() and
 * ferry_last_error_message().
 */

#include <stddef.h>
#include <stdint.h>

#include "ferry/ferry_c_api.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Error Codes - file-specific extensions to FerryStatus
 * ============================================================================ */

#define FERRY_ERR_FILE_SOURCE_MISSING 100
#define FERRY_ERR_FILE_CONFLICT 101
#define FERRY_ERR_FILE_CROSS_VOLUME 102
#define FERRY_ERR_FILE_ACCESS_DENIED 103
#define FERRY_ERR_FILE_DISK_FULL 104
#define FERRY_ERR_FILE_INVALID_PATH 105
#define FERRY_ERR_FILE_IO_ERROR 106
#define FERRY_ERR_FILE_TRAVERSAL 107
#define FERRY_ERR_FILE_UNKNOWN_ALGORITHM 108

/* ============================================================================
 * Enumerations
 * ============================================================================ */

/**
 * @brief File operation error taxonomy
 */
typedef enum FerryFileError
{
    FERRY_FILE_ERROR_NONE = 0,             /**< No error */
    FERRY_FILE_ERROR_SOURCE_MISSING,       /**< Source absent, or a directory where a file was required */
    FERRY_FILE_ERROR_CONFLICT,             /**< Destination exists and overwrite was not requested */
    FERRY_FILE_ERROR_CROSS_VOLUME,         /**< Rename impossible across volumes */
    FERRY_FILE_ERROR_ACCESS_DENIED,        /**< Permission or lock conflict */
    FERRY_FILE_ERROR_DISK_FULL,            /**< No space left on device */
    FERRY_FILE_ERROR_INVALID_PATH,         /**< Malformed path or parent missing */
    FERRY_FILE_ERROR_IO_ERROR,             /**< Other I/O failure */
    FERRY_FILE_ERROR_TRAVERSAL_ENTRY,      /**< Entry unreadable during traversal */
    FERRY_FILE_ERROR_UNKNOWN_ALGORITHM,    /**< Hash identifier not recognized */
    FERRY_FILE_ERROR_UNKNOWN               /**< Unknown error */
} FerryFileError;

/**
 * @brief Cross-volume behavior of ferry_move
 */
typedef enum FerryCrossVolumePolicy
{
    FERRY_CROSS_VOLUME_DEFAULT = -1,          /**< Use the engine default (allow) */
    FERRY_CROSS_VOLUME_ALLOW = 0,             /**< Copy then delete the source */
    FERRY_CROSS_VOLUME_NOTIFY_THEN_ALLOW = 1, /**< Invoke on_cross_volume, then copy */
    FERRY_CROSS_VOLUME_FAIL = 2               /**< Fail with FERRY_ERR_FILE_CROSS_VOLUME */
} FerryCrossVolumePolicy;

/* ============================================================================
 * Structures
 * ============================================================================ */

typedef void (*FerryCrossVolumeCallback)(const char* source, const char* destination, void* user_data);

/**
 * @brief Parameters for ferry_copy and ferry_move
 *
 * Initialize with ferry_transfer_request_init() before filling in paths.
 */
typedef struct FerryTransferRequest
{
    /** Source path (required, borrowed) */
    const char* source;

    /** Destination path (required, borrowed) */
    const char* destination;

    /** Replace an existing destination */
    FerryBool overwrite;

    /** Accept a directory source */
    FerryBool allow_directories;

    /** Create missing parents of destination */
    FerryBool create_parent_dirs;

    /** Keep the previous modification time of an overwritten destination (copy only) */
    FerryBool preserve_mod_time;

    /** Cross-volume behavior (move only) */
    FerryCrossVolumePolicy cross_volume_policy;

    /** Optional notification for FERRY_CROSS_VOLUME_NOTIFY_THEN_ALLOW */
    FerryCrossVolumeCallback on_cross_volume;
    void* user_data;
} FerryTransferRequest;

typedef struct FerryTransferOutcome
{
    uint64_t bytes_transferred;
    FerryBool no_op;
    FerryBool used_cross_volume_fallback;
} FerryTransferOutcome;

/**
 * @brief Receives an entry that could not be read during recursion
 *
 * When set, the walk skips that entry and continues. Strings are borrowed for the duration of the call.
 */
typedef void (*FerryTraversalErrorCallback)(const char* path, FerryFileError error, const char* message,
                                            void* user_data);

/**
 * @brief Decides whether a subdirectory is reported and descended into
 *
 * Return FERRY_FALSE to prune the directory and everything below it.
 */
typedef FerryBool (*FerryDirectoryPredicate)(const char* directory_path, void* user_data);

/**
 * @brief Selection rules for listing and recursion
 */
typedef struct FerryTraversalOptions
{
    /** Extensions to accept, e.g. {"txt", ".md"} (NULL = accept all, borrowed) */
    const char* const* allowed_extensions;
    size_t allowed_extension_count;

    /** Descend into symlinked directories */
    FerryBool follow_symlinks;

    /** Report files */
    FerryBool include_files;

    /** Report directories */
    FerryBool include_directories;

    /** Prunes subdirectories (NULL = keep all) */
    FerryDirectoryPredicate directory_predicate;

    /**
     * Unreadable entries during recursion (NULL = the walk stops and the call
     * fails with FERRY_ERR_FILE_TRAVERSAL)
     */
    FerryTraversalErrorCallback on_error;

    /** Passed to directory_predicate and on_error */
    void* user_data;
} FerryTraversalOptions;

/**
 * @brief Receives one entry. Return FERRY_FALSE to stop the walk early.
 *
 * Strings are borrowed and valid only for the duration of the call.
 */
typedef FerryBool (*FerryEntryCallback)(const char* full_path, const char* leaf_name, FerryBool is_directory,
                                        void* user_data);

/* ============================================================================
 * Initialization
 * ============================================================================ */

FERRY_API void ferry_transfer_request_init(FerryTransferRequest* request);
FERRY_API void ferry_traversal_options_init(FerryTraversalOptions* options);

/* ============================================================================
 * Transfers
 * ============================================================================ */

/**
 * @brief Copy a file (or directory with allow_directories) atomically
 *
 * @param request Transfer parameters (required)
 * @param out_outcome Result details (can be NULL)
 * @param status Error reporting (required)
 * @threadsafety Thread-safe
 */
FERRY_API void ferry_copy(const FerryTransferRequest* request, FerryTransferOutcome* out_outcome,
                          FerryStatus* status);

/**
 * @brief Move a file (or directory with allow_directories)
 *
 * @param request Transfer parameters (required)
 * @param out_outcome Result details (can be NULL)
 * @param status Error reporting (required)
 * @threadsafety Thread-safe
 */
FERRY_API void ferry_move(const FerryTransferRequest* request, FerryTransferOutcome* out_outcome,
                          FerryStatus* status);

/* ============================================================================
 * Hashing
 * ============================================================================ */

/**
 * @brief Hex digest of a file's contents
 *
 * @param path File to hash (required)
 * @param algorithm Algorithm identifier, e.g. "sha256" or "crc32" (required)
 * @param buffer_size Read chunk size in bytes (0 = library default)
 * @param out_digest Receives the digest (required)
 * @param status Error reporting (required)
 * @ownership out_digest must be released with ferry_string_dispose()
 */
FERRY_API void ferry_compute_hash_file(const char* path, const char* algorithm, size_t buffer_size,
                                       FerryOwnedString* out_digest, FerryStatus* status);

/**
 * @brief Hex digest of an in-memory buffer
 *
 * @param data Bytes to hash (can be NULL when len is 0)
 * @ownership out_digest must be released with ferry_string_dispose()
 */
FERRY_API void ferry_compute_hash_bytes(const uint8_t* data, size_t len, const char* algorithm,
                                        FerryOwnedString* out_digest, FerryStatus* status);

/* ============================================================================
 * Traversal
 * ============================================================================ */

/**
 * @brief Report the entries directly inside a directory
 *
 * @param options Selection rules (NULL = files and directories, all extensions)
 */
FERRY_API void ferry_list_children(const char* directory, const FerryTraversalOptions* options,
                                   FerryEntryCallback callback, void* user_data, FerryStatus* status);

/**
 * @brief Walk a tree depth-first, reporting every file that passes options
 *
 * Unreadable subdirectories are skipped; a failure on the root is reported through status.
 * include_files and include_directories are ignored.
 *
 * @param options Selection rules (NULL = all extensions)
 */
FERRY_API void ferry_recurse_files(const char* root, const FerryTraversalOptions* options,
                                   FerryEntryCallback callback, void* user_data, FerryStatus* status);

/**
 * @brief Walk a tree depth-first, reporting root and every directory below it
 *
 * Same error behavior as ferry_recurse_files().
 */
FERRY_API void ferry_recurse_dirs(const char* root, const FerryTraversalOptions* options,
                                  FerryEntryCallback callback, void* user_data, FerryStatus* status);

/* ============================================================================
 * Diagnostics
 * ============================================================================ */

/** @brief FerryFileError of the last failed call on this thread */
FERRY_API FerryFileError ferry_last_file_error(void);

FERRY_API const char* ferry_file_error_to_string(FerryFileError error);

#ifdef __cplusplus
}  // extern "C"
#endif
