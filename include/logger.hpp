// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "stackprof_base.hpp"
#include "version.hpp"

#include <stdarg.h>

namespace stackprof {

enum LOG_OPTS {
  LOG_DISABLE = 0,
  LOG_SYSLOG = 1,
  LOG_STDOUT = 2,
  LOG_STDERR = 3,
  LOG_FILE = 4,
};

// Syslog severities. A negative level forces the message whatever the
// configured level.
enum LOG_LVL {
  LL_FORCE_INFORMATIONAL = -6,
  LL_EMERGENCY = 0,
  LL_ALERT = 1,
  LL_CRITICAL = 2,
  LL_ERROR = 3,
  LL_WARNING = 4,
  LL_NOTICE = 5,
  LL_INFORMATIONAL = 6,
  LL_DEBUG = 7,
  LL_LENGTH,
};

// Allow for compile-time argument type checking for printf-like functions
#define printflike(x, y) __attribute__((format(printf, x, y)))

// opts is the file path in LOG_FILE mode
bool LOG_open(int mode, const char *opts);
void LOG_close();

void LOG_setlevel(int lvl);
int LOG_getlevel();

bool LOG_is_logging_enabled_for_level(int level);

// Writes one line tagged with level and name (no level check)
printflike(3, 4) void olprintfln(int lvl, const char *name, const char *fmt,
                                 ...);
void vlprintfln(int lvl, const char *name, const char *format, va_list args);

constexpr int log_severity(int lvl) { return lvl < 0 ? -lvl : lvl; }

/******************************* Logging Macros *******************************/
// Arguments are only evaluated when the level is enabled
#define LG_IF_LVL_OK(level, ...)                                               \
  do {                                                                         \
    if (unlikely(stackprof::LOG_is_logging_enabled_for_level(level))) {        \
      stackprof::olprintfln(stackprof::log_severity(level), MYNAME,            \
                            __VA_ARGS__);                                      \
    }                                                                          \
  } while (false)

#define LG_ERR(...) LG_IF_LVL_OK(stackprof::LL_ERROR, __VA_ARGS__)
#define LG_WRN(...) LG_IF_LVL_OK(stackprof::LL_WARNING, __VA_ARGS__)
#define LG_NTC(...) LG_IF_LVL_OK(stackprof::LL_NOTICE, __VA_ARGS__)
#define LG_NFO(...) LG_IF_LVL_OK(stackprof::LL_INFORMATIONAL, __VA_ARGS__)
#define LG_DBG(...) LG_IF_LVL_OK(stackprof::LL_DEBUG, __VA_ARGS__)
#define PRINT_NFO(...)                                                         \
  LG_IF_LVL_OK(stackprof::LL_FORCE_INFORMATIONAL, __VA_ARGS__)

} // namespace stackprof
