#pragma once

#include "dbjob/platform/config_cmake.h"

#if defined(_WIN64) || defined(WIN64) || defined(__WIN32__) || defined(_WIN32) || defined(WIN32)
#    define _win_ 1
#endif

#if defined(_MSC_VER)
#    undef NOMINMAX
#    define NOMINMAX
#    include <basetsd.h>
#    define ssize_t SSIZE_T
#    define HAVE_SSIZE_T 1
#
#    include <winsock2.h>
// DO NOT REORDER
#    include <windows.h>
#endif

// Upper bound of positional result sets a single multi-result read can demultiplex.
#define DBJOB_MAX_RESULT_SETS 8

// Buffer size used for chunked reads of variable length columns.
#define DBJOB_DATA_CHUNK_SIZE 4096

// Output buffer size used when an output parameter does not declare one.
#define DBJOB_DEFAULT_OUTPUT_SIZE 4000
