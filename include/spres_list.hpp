// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <climits>
#include <cstdint>

namespace stackprof {

enum : uint16_t { SP_COMMON_START_RANGE = 1000, SP_NATIVE_START_RANGE = 2000 };

#define EXPAND_ENUM(a, b) SP_WHAT_##a,
#define EXPAND_ERROR_MESSAGE(a, b) #a ": " b,

#define COMMON_ERROR_TABLE(X)                                                  \
  X(BADALLOC, "allocation error")                                              \
  X(STDEXCEPT, "standard exception caught")                                    \
  X(UKNWEXCEPT, "unknown exception caught")

#define NATIVE_ERROR_TABLE(X)                                                  \
  X(INVALID_ELF, "invalid elf file")                                           \
  X(NO_SYMTAB, "no symbol table in elf file")                                  \
  X(NO_MATCHING_LOAD_SEGMENT, "unable to find a LOAD segment matching offset") \
  X(PROCMAPS, "error reading process memory maps")                             \
  X(BPF_MAP, "error accessing bpf map")                                        \
  X(STACK_LOOKUP, "stack trace not found in stack table")                      \
  X(STACK_DECODE, "unable to decode stack trace")                              \
  X(NEGATIVE_STACK_ID, "stack capture failed in kernel")                       \
  X(SYMBOLIZER, "symbolizer error")                                            \
  X(PPROF, "error in pprof manipulations")                                     \
  X(SIGNAL, "error setting up signal handling")

enum SPRes_What : uint16_t {
  SP_WHAT_MIN_ERRNO = SP_COMMON_START_RANGE,
  // common errors
  COMMON_ERROR_TABLE(EXPAND_ENUM) COMMON_ERROR_SIZE,
  SP_WHAT_MIN_NATIVE = SP_NATIVE_START_RANGE,
  NATIVE_ERROR_TABLE(EXPAND_ENUM) NATIVE_ERROR_SIZE,
  // max
  SP_WHAT_MAX = SHRT_MAX,
};

/// Retrieve an explicit error message matching the error ID (from table above)
const char *spres_error_message(int16_t what);

} // namespace stackprof
