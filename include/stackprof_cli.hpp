// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "stackprof_defs.hpp"
#include "version.hpp"

#include <chrono>
#include <string>

namespace stackprof {

inline constexpr std::string_view k_default_counts_map_path =
    "/sys/fs/bpf/stackprof/counts";
inline constexpr std::string_view k_default_stacks_map_path =
    "/sys/fs/bpf/stackprof/stack_traces";
inline constexpr std::string_view k_default_profile_path = "cpu.pprof";

// NOLINTNEXTLINE(clang-analyzer-optin.performance.Padding)
struct StackprofCLI {
public:
  // Returns a CLI::ExitCodes value, continue_exec is set when the profiler
  // should run
  int parse(int argc, const char *argv[]);

  void print() const;

  // Profiling options
  int pid{0};
  std::chrono::seconds wait{k_default_profiling_duration};
  std::string profile_path;
  uint32_t frequency{k_default_sampling_frequency};
  bool symbolize{true};

  // Sample tables
  std::string counts_map;
  std::string stacks_map;

  // debug
  std::string log_level;
  std::string log_mode;
  bool show_config{false};
  bool show_samples{false};
  bool version{false};

  bool continue_exec{false};
};

// Options of the addr2func tool
struct Addr2FuncCLI {
public:
  int parse(int argc, const char *argv[]);

  std::string path;
  ProcessAddress_t addr{};
  ProcessAddress_t memory_start{};
  Offset_t file_offset{};
  std::string log_level;

  bool continue_exec{false};
};

} // namespace stackprof
