// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "logger.hpp"
#include "spres_def.hpp"
#include "spres_list.hpp"

#include <cerrno>
#include <cstring>

namespace stackprof {

/// Location of an error, logged after the caller's message
#define LOG_ERROR_DETAILS(log_func, what)                                      \
  log_func("%s at %s:%u", stackprof::spres_error_message(what), __FILE__,      \
           __LINE__);

/// Logs with LG_ERR and returns a fatal result
#define SPRES_RETURN_ERROR_LOG(what, ...)                                      \
  do {                                                                         \
    LG_ERR(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_ERR, what);                                           \
    return stackprof::spres_error(what);                                       \
  } while (0)

/// Logs with LG_WRN and returns a warning
#define SPRES_RETURN_WARN_LOG(what, ...)                                       \
  do {                                                                         \
    LG_WRN(__VA_ARGS__);                                                       \
    LOG_ERROR_DETAILS(LG_WRN, what);                                           \
    return stackprof::spres_warn(what);                                        \
  } while (0)

/// Returns an error (logging errno) when eval is -1
#define SPRES_CHECK_ERRNO(eval, what, ...)                                     \
  do {                                                                         \
    if (unlikely((eval) == -1)) {                                              \
      const int e = errno;                                                     \
      LG_ERR(__VA_ARGS__);                                                     \
      LG_ERR("errno(%d): %s", e, strerror(e));                                 \
      LOG_ERROR_DETAILS(LG_ERR, what);                                         \
      return stackprof::spres_error(what);                                     \
    }                                                                          \
  } while (0)

/// Returns an error when eval is false
#define SPRES_CHECK_BOOL(eval, what, ...)                                      \
  do {                                                                         \
    if (unlikely(!(eval))) {                                                   \
      SPRES_RETURN_ERROR_LOG(what, __VA_ARGS__);                               \
    }                                                                          \
  } while (0)

/// Logs a result that is not OK. Returns true when it is fatal.
inline bool spres_log_forward(SPRes res, const char *file, unsigned line) {
  if (IsSPResOK(res)) {
    return false;
  }
  if (IsSPResFatal(res)) {
    LG_ERR("Forward error at %s:%u - %s", file, line,
           spres_error_message(res._what));
    return true;
  }
  if (res._sev == SP_SEV_WARN) {
    LG_WRN("Recover from warning at %s:%u - %s", file, line,
           spres_error_message(res._what));
  } else {
    LG_NTC("Recover from notice at %s:%u - %s", file, line,
           spres_error_message(res._what));
  }
  return false;
}

/// Forwards fatal results, warnings and notices are logged and dropped
#define SPRES_CHECK_FWD(spres)                                                 \
  do {                                                                         \
    stackprof::SPRes lspres = spres; /* single eval */                         \
    if (stackprof::spres_log_forward(lspres, __FILE__, __LINE__)) {            \
      return lspres;                                                           \
    }                                                                          \
  } while (0)

} // namespace stackprof
