/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

/*
 * C API bridge for FerryCore
 */

#include <cstring>
#include <new>
#include <string>

#include "CApiErrorState.h"
#include "ferry/ferry_c_api.h"

namespace {
    struct LastError {
        FerryFileError code = FERRY_FILE_ERROR_NONE;
        std::string message;
    };

    LastError& lastError() {
        thread_local LastError state;
        return state;
    }
}

namespace Ferry::Core::CApi {

void setLastError(FerryFileError code, std::string message) {
    auto& state = lastError();
    state.code = code;
    state.message = std::move(message);
}

void clearLastError() noexcept {
    auto& state = lastError();
    state.code = FERRY_FILE_ERROR_NONE;
    state.message.clear();
}

FerryStatus copyStringOut(const std::string& s, FerryOwnedString* out) {
    if (!out) return FERRY_ERR_INVALID_ARG;
    char* mem = static_cast<char*>(ferry_alloc(s.size() + 1));
    if (!mem) return FERRY_ERR_NO_MEMORY;
    std::memcpy(mem, s.data(), s.size());
    mem[s.size()] = '\0';
    out->ptr = mem;
    out->len = static_cast<uint32_t>(s.size());
    return FERRY_OK;
}

} // namespace Ferry::Core::CApi

extern "C" {

FERRY_API void ferry_get_version(uint32_t* major, uint32_t* minor, uint32_t* patch, uint32_t* abi) {
    if (major) *major = 1;
    if (minor) *minor = 0;
    if (patch) *patch = 0;
    if (abi) *abi = 1;
}

FERRY_API void* ferry_alloc(size_t size) {
    return ::operator new(size, std::nothrow);
}

FERRY_API void ferry_free(void* p) {
    ::operator delete(p);
}

FERRY_API const char* ferry_status_to_string(FerryStatus s) {
    switch (static_cast<int>(s)) {
        case FERRY_OK:
            return "FERRY_OK";
        case FERRY_ERR_UNKNOWN:
            return "FERRY_ERR_UNKNOWN";
        case FERRY_ERR_INVALID_ARG:
            return "FERRY_ERR_INVALID_ARG";
        case FERRY_ERR_NOT_FOUND:
            return "FERRY_ERR_NOT_FOUND";
        case FERRY_ERR_BUFFER_TOO_SMALL:
            return "FERRY_ERR_BUFFER_TOO_SMALL";
        case FERRY_ERR_NO_MEMORY:
            return "FERRY_ERR_NO_MEMORY";
        case FERRY_ERR_UNAVAILABLE:
            return "FERRY_ERR_UNAVAILABLE";
        case FERRY_ERR_FILE_SOURCE_MISSING:
            return "FERRY_ERR_FILE_SOURCE_MISSING";
        case FERRY_ERR_FILE_CONFLICT:
            return "FERRY_ERR_FILE_CONFLICT";
        case FERRY_ERR_FILE_CROSS_VOLUME:
            return "FERRY_ERR_FILE_CROSS_VOLUME";
        case FERRY_ERR_FILE_ACCESS_DENIED:
            return "FERRY_ERR_FILE_ACCESS_DENIED";
        case FERRY_ERR_FILE_DISK_FULL:
            return "FERRY_ERR_FILE_DISK_FULL";
        case FERRY_ERR_FILE_INVALID_PATH:
            return "FERRY_ERR_FILE_INVALID_PATH";
        case FERRY_ERR_FILE_IO_ERROR:
            return "FERRY_ERR_FILE_IO_ERROR";
        case FERRY_ERR_FILE_TRAVERSAL:
            return "FERRY_ERR_FILE_TRAVERSAL";
        case FERRY_ERR_FILE_UNKNOWN_ALGORITHM:
            return "FERRY_ERR_FILE_UNKNOWN_ALGORITHM";
        default:
            return "FERRY_STATUS_UNKNOWN";
    }
}

FERRY_API void ferry_string_dispose(FerryOwnedString s) {
    if (s.ptr) ferry_free(const_cast<char*>(s.ptr));
}

FERRY_API const char* ferry_last_error_message(void) {
    return lastError().message.c_str();
}

FERRY_API FerryFileError ferry_last_file_error(void) {
    return lastError().code;
}

}  // extern "C"
