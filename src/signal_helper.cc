// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "signal_helper.hpp"

#include "defer.hpp"
#include "logger.hpp"
#include "spres.hpp"

#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <cstdio>
#include <ctime>
#include <unistd.h>

#ifdef __GLIBC__
#  include <execinfo.h>
#endif

namespace stackprof {
bool process_is_alive(int pidId) {
  return -1 != kill(pidId, 0) || errno != ESRCH;
}

int convert_addr_to_string(uintptr_t ptr, char *buff, size_t buff_size) {
  const size_t k_hex_digits_per_byte = 2;
  const size_t k_ptr_hex_digits = sizeof(uintptr_t) * k_hex_digits_per_byte;
  const size_t k_required_buffer_size = k_ptr_hex_digits + 1;
  const int k_nibble_mask = 0xF;
  const int k_decimal_threshold = 10;

  if (buff_size < k_required_buffer_size) {
    return -1;
  }

  int len = 0;
  for (int i = k_ptr_hex_digits - 1; i >= 0; --i) {
    const int nibble = (ptr >> (i * 4)) & k_nibble_mask;
    buff[len++] = static_cast<char>(nibble < k_decimal_threshold
                                        ? ('0' + nibble)
                                        : ('a' + nibble - k_decimal_threshold));
  }
  buff[len] = '\0';
  return len;
}

/*****************************  SIGSEGV Handler *******************************/
void sigsegv_handler(int sig, siginfo_t *si, void *uc) {
  (void)uc;
  constexpr char msg1[] = MYNAME ": encountered a SIGSEGV and will exit.\n";
  if (write(STDERR_FILENO, msg1, sizeof(msg1) - 1) < 0) {
    return;
  }

  if (sig == SIGSEGV) {
    constexpr char msg2[] = "Fault address: ";
    if (write(STDERR_FILENO, msg2, sizeof(msg2) - 1) < 0) {
      return;
    }
    const auto fault_addr = reinterpret_cast<uintptr_t>(si->si_addr);
    char addr_buf[32];
    int len = convert_addr_to_string(fault_addr, addr_buf, 32);
    if (len > 0) {
      addr_buf[len++] = '\n';
      if (write(STDERR_FILENO, addr_buf, len) < 0) {
        return;
      }
    }
  }

#ifdef __GLIBC__
  // Unsafe but useful for debugging (performed last)
  constexpr size_t k_stacktrace_buffer_size = 4096;
  static void *buf[k_stacktrace_buffer_size] = {};
  int const sz = backtrace(buf, k_stacktrace_buffer_size);
  backtrace_symbols_fd(buf, sz, STDERR_FILENO);
#endif

  _exit(128 + sig); // standard exit codes for signals
}

SPRes install_sigsegv_handler() {
  struct sigaction sigaction_handlers = {};
  sigaction_handlers.sa_sigaction = sigsegv_handler;
  sigaction_handlers.sa_flags = SA_SIGINFO;
  SPRES_CHECK_ERRNO(sigaction(SIGSEGV, &sigaction_handlers, nullptr),
                    SP_WHAT_SIGNAL, "Unable to install SIGSEGV handler");
  return {};
}

SPRes wait_for_duration_or_signal(std::chrono::nanoseconds timeout,
                                  bool &interrupted) {
  interrupted = false;
  sigset_t sigset;
  sigemptyset(&sigset);
  sigaddset(&sigset, SIGINT);
  sigaddset(&sigset, SIGTERM);
  sigset_t old_sigset;
  SPRES_CHECK_BOOL(pthread_sigmask(SIG_BLOCK, &sigset, &old_sigset) == 0,
                   SP_WHAT_SIGNAL, "Unable to block termination signals");
  defer { pthread_sigmask(SIG_SETMASK, &old_sigset, nullptr); };

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      return {};
    }
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(remaining);
    const timespec wait_time{.tv_sec = secs.count(),
                             .tv_nsec = (remaining - secs).count()};
    int const sig = sigtimedwait(&sigset, nullptr, &wait_time);
    if (sig == SIGINT || sig == SIGTERM) {
      LG_NFO("Received signal %d, stopping collection", sig);
      interrupted = true;
      return {};
    }
    if (sig == -1 && errno == EAGAIN) {
      return {}; // timeout
    }
    if (sig == -1 && errno != EINTR) {
      SPRES_RETURN_ERROR_LOG(SP_WHAT_SIGNAL, "sigtimedwait failed (%s)",
                             strerror(errno));
    }
    // interrupted by an unrelated signal, wait for the remaining time
  }
}

} // namespace stackprof
