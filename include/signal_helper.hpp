// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "spres_def.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

#include <signal.h>

namespace stackprof {
bool process_is_alive(int pidId);

int convert_addr_to_string(uintptr_t ptr, char *buff, size_t buff_size);

void sigsegv_handler(int sig, siginfo_t *si, void *uc);

SPRes install_sigsegv_handler();

// Blocks SIGINT / SIGTERM and waits for one of them or for the timeout.
// interrupted is set when a signal ended the wait.
SPRes wait_for_duration_or_signal(std::chrono::nanoseconds timeout,
                                  bool &interrupted);

} // namespace stackprof
