// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "stackprof.hpp"

#include "addr_resolver.hpp"
#include "bpf_sample_tables.hpp"
#include "logger.hpp"
#include "pprof/stackprof_pprof.hpp"
#include "profile_assembler.hpp"
#include "profile_symbolizer.hpp"
#include "signal_helper.hpp"
#include "spres.hpp"
#include "stackprof_cli.hpp"

namespace stackprof {

StackprofParams stackprof_params_from_cli(const StackprofCLI &cli) {
  StackprofParams params;
  params.pid = cli.pid;
  params.wait = cli.wait;
  params.profile_path = cli.profile_path;
  params.frequency = cli.frequency;
  params.counts_map = cli.counts_map;
  params.stacks_map = cli.stacks_map;
  params.symbolize = cli.symbolize;
  params.show_samples = cli.show_samples;
  return params;
}

SPRes stackprof_build_profile(const StackprofParams &params,
                              const MappingList &mappings,
                              const CountsTable &counts,
                              const StackTraceTable &stacks,
                              Profile &profile) {
  try {
    ProfileAssembler assembler(mappings, params.show_samples);
    if (params.pid > 0) {
      // the counts map can be filled by a system wide sampler
      assembler.set_target_pid(static_cast<uint32_t>(params.pid));
    }
    SPRes const res = assembler.fill(counts, stacks, profile);
    if (IsSPResNotOK(res)) {
      LG_WRN("Profile is partial (%s)", spres_error_message(res._what));
    }
    print_assembly_stats(assembler.stats());

    if (params.symbolize) {
      AddrResolver resolver;
      MappingIdx_t exe_mapping_idx = k_mapping_idx_null;
      SPRes const sym_res = create_exe_resolver(params.pid, profile.mappings,
                                                exe_mapping_idx, resolver);
      if (IsSPResOK(sym_res)) {
        symbolize_profile(profile, exe_mapping_idx, resolver);
      } else {
        LG_WRN("Writing unsymbolized profile (%s)",
               spres_error_message(sym_res._what));
      }
    }

    if (params.show_samples) {
      print_samples(profile);
    }
  }
  CatchExcept2SPRes();
  return {};
}

SPRes stackprof_wait_for_samples(const StackprofParams &params,
                                 Profile &profile) {
  // stamped before the collection window
  profile = create_profile(std::chrono::nanoseconds{0}, params.frequency);
  const auto start = std::chrono::steady_clock::now();
  bool interrupted = false;
  SPRES_CHECK_FWD(wait_for_duration_or_signal(params.wait, interrupted));
  const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - start);
  profile.duration_nanos = duration.count();
  if (interrupted) {
    LG_NTC("Collection interrupted after %ldms",
           std::chrono::duration_cast<std::chrono::milliseconds>(duration)
               .count());
  }
  return {};
}

SPRes stackprof_run(const StackprofParams &params) {
  try {
    MappingList mappings;
    SPRES_CHECK_FWD(parse_proc_maps(params.pid, mappings));
    print_mappings(mappings);

    bpf_setup_logging();
    BpfCountsTable counts;
    SPRES_CHECK_FWD(BpfCountsTable::open(params.counts_map, counts));
    BpfStackTraceTable stacks;
    SPRES_CHECK_FWD(BpfStackTraceTable::open(params.stacks_map, stacks));

    PRINT_NFO("Collecting samples of pid %d for %lds", params.pid,
              params.wait.count());
    Profile profile;
    SPRES_CHECK_FWD(stackprof_wait_for_samples(params, profile));
    SPRES_CHECK_FWD(
        stackprof_build_profile(params, mappings, counts, stacks, profile));
    SPRES_CHECK_FWD(pprof_write_profile_file(profile, params.profile_path));
    PRINT_NFO("Wrote %zu samples to %s", profile.samples.size(),
              params.profile_path.c_str());
  }
  CatchExcept2SPRes();
  return {};
}

} // namespace stackprof
