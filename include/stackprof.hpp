// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profile.hpp"
#include "proc_maps.hpp"
#include "sample_tables.hpp"
#include "spres_def.hpp"

#include <chrono>
#include <string>
#include <sys/types.h>

namespace stackprof {

struct StackprofCLI;

struct StackprofParams {
  pid_t pid{0};
  std::chrono::seconds wait{k_default_profiling_duration};
  std::string profile_path;
  uint32_t frequency{k_default_sampling_frequency};
  std::string counts_map;
  std::string stacks_map;
  bool symbolize{true};
  bool show_samples{false};
};

StackprofParams stackprof_params_from_cli(const StackprofCLI &cli);

// Assembles the sample tables into profile and attaches function names of
// the main executable when requested. Keys of processes other than
// params.pid are skipped.
SPRes stackprof_build_profile(const StackprofParams &params,
                              const MappingList &mappings,
                              const CountsTable &counts,
                              const StackTraceTable &stacks, Profile &profile);

// Stamps a new profile with the current time, waits for the collection
// duration (or a termination signal) and records the time actually waited
SPRes stackprof_wait_for_samples(const StackprofParams &params,
                                 Profile &profile);

// Reads the maps of the target, waits for the collection duration (or a
// termination signal) then writes the pprof file
SPRes stackprof_run(const StackprofParams &params);

} // namespace stackprof
