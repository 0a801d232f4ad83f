// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace stackprof {

namespace {

constexpr size_t k_log_line_cap = 4096;
// syslog "user-level messages" facility
constexpr int k_syslog_facility_user = 1;

struct LoggerContext {
  int fd{-1};
  int mode{LOG_STDERR};
  int level{LL_ERROR};
};

LoggerContext log_ctx;

constexpr std::array<const char *, LL_LENGTH> k_level_names = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};

int syslog_connect() {
  const sockaddr_un sa = {AF_UNIX, "/dev/log"};
  int const fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }
  if (connect(fd, reinterpret_cast<const sockaddr *>(&sa), sizeof(sa)) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

// `<LEVEL>Mmm DD hh:mm:ss.uuuuuu name[pid]: ` or the syslog priority form
int format_header(char *buf, size_t cap, int lvl, const char *name) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now);
  const auto usecs =
      std::chrono::duration_cast<std::chrono::microseconds>(now - secs);

  time_t const t = secs.count();
  struct tm lt;
  localtime_r(&t, &lt);
  char tm_str[sizeof("mmm dd HH:MM:SS0")];
  (void)strftime(tm_str, sizeof(tm_str), "%b %d %H:%M:%S", &lt);

  if (log_ctx.mode == LOG_SYSLOG) {
    return snprintf(buf, cap, "<%d>%s.%06ld %s[%d]: ",
                    (k_syslog_facility_user * LL_LENGTH) + lvl, tm_str,
                    usecs.count(), name, getpid());
  }
  return snprintf(buf, cap, "<%s>%s.%06ld %s[%d]: ", k_level_names[lvl],
                  tm_str, usecs.count(), name, getpid());
}

void write_line(const char *buf, size_t len) {
  ssize_t rc = 0;
  do {
    if (log_ctx.mode == LOG_SYSLOG) {
      rc = sendto(log_ctx.fd, buf, len, MSG_NOSIGNAL, nullptr, 0);
    } else {
      rc = write(log_ctx.fd, buf, len);
    }
  } while (rc < 0 && errno == EINTR);
}

} // namespace

bool LOG_open(int mode, const char *opts) {
  LOG_close();
  log_ctx.mode = mode;

  switch (mode) {
  case LOG_DISABLE:
    break;
  case LOG_SYSLOG:
    log_ctx.fd = syslog_connect();
    return log_ctx.fd >= 0;
  case LOG_STDERR:
    log_ctx.fd = STDERR_FILENO;
    break;
  case LOG_FILE:
    log_ctx.fd = open(opts, O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    return log_ctx.fd >= 0;
  case LOG_STDOUT:
  default:
    log_ctx.fd = STDOUT_FILENO;
    break;
  }
  return true;
}

void LOG_close() {
  if (log_ctx.fd >= 0 &&
      (log_ctx.mode == LOG_SYSLOG || log_ctx.mode == LOG_FILE)) {
    close(log_ctx.fd);
  }
  log_ctx.fd = -1;
}

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    log_ctx.level = lvl;
  }
}

int LOG_getlevel() { return log_ctx.level; }

bool LOG_is_logging_enabled_for_level(int level) {
  return level <= log_ctx.level;
}

void vlprintfln(int lvl, const char *name, const char *format,
                va_list args) {
  if (log_ctx.fd < 0 || !format || !name) {
    return;
  }
  if (lvl < LL_EMERGENCY || lvl > LL_DEBUG) {
    lvl = log_ctx.level;
  }

  std::array<char, k_log_line_cap> buf;
  int const header_len = format_header(buf.data(), buf.size(), lvl, name);
  if (header_len < 0) {
    return;
  }
  // room for the newline and the terminating zero
  size_t const header_sz =
      std::min(static_cast<size_t>(header_len), buf.size() - 2);
  size_t const cap = buf.size() - header_sz - 2;
  int const body_len = vsnprintf(&buf[header_sz], cap + 1, format, args);
  size_t len = header_sz +
      (body_len < 0 ? 0 : std::min(static_cast<size_t>(body_len), cap));

  // syslog datagrams carry one message each, other sinks are line based
  if (log_ctx.mode != LOG_SYSLOG) {
    buf[len++] = '\n';
  }
  write_line(buf.data(), len);
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void olprintfln(int lvl, const char *name, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlprintfln(lvl, name, fmt, args);
  va_end(args);
}

} // namespace stackprof
