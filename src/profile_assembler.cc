// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profile_assembler.hpp"

#include "logger.hpp"
#include "spres.hpp"

#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <span>
#include <string>

namespace stackprof {

namespace {

std::string addresses_to_string(std::span<const uint64_t> addrs) {
  return absl::StrJoin(addrs, " ", [](std::string *out, uint64_t addr) {
    absl::StrAppendFormat(out, "0x%x", addr);
  });
}

} // namespace

SPRes ProfileAssembler::fill(const CountsTable &counts,
                             const StackTraceTable &stacks, Profile &profile) {
  _location_index.clear();
  _stats = {};
  profile.locations.clear();
  profile.samples.clear();

  SPRes const res =
      counts.iterate([&](const StackCountKey &key, uint64_t count) {
        add_key(key, count, stacks, profile);
      });
  if (IsSPResNotOK(res)) {
    // keep what was gathered before the error
    _stats.iteration_error = true;
    LG_WRN("Counts table iteration failed after %lu keys (%s)", _stats.nb_keys,
           spres_error_message(res._what));
  }

  // Mapping ids follow the order of the maps file
  for (size_t i = 0; i < _mappings.size(); ++i) {
    _mappings[i].id = i + 1;
  }
  profile.mappings = _mappings;
  _stats.nb_locations = profile.locations.size();
  return IsSPResNotOK(res) ? spres_warn(res._what) : SPRes{};
}

void ProfileAssembler::add_key(const StackCountKey &key, uint64_t count,
                               const StackTraceTable &stacks,
                               Profile &profile) {
  ++_stats.nb_keys;
  if (_target_pid && key.pid != *_target_pid) {
    // mappings and symbols only describe the target
    ++_stats.other_pid_keys;
    LG_DBG("Skipping key of pid %u", key.pid);
    return;
  }
  if (_show_samples) {
    PRINT_NFO("pid=%u user_stack_id=%d kernel_stack_id=%d seen %lu times",
              key.pid, key.user_stack_id, key.kernel_stack_id, count);
  }

  if (key.user_stack_id < 0) {
    ++_stats.negative_user_stack;
    LG_WRN("Skipping pid %u: user stack capture failed (%d)", key.pid,
           key.user_stack_id);
    return;
  }

  RawStack user_stack;
  SPRes res = get_stack(stacks, key.user_stack_id, user_stack);
  if (IsSPResNotOK(res)) {
    if (res._what == SP_WHAT_STACK_DECODE) {
      ++_stats.user_stack_decode_failures;
    } else {
      ++_stats.user_stack_lookup_failures;
    }
    LG_WRN("Skipping pid %u: user stack %d unavailable (%s)", key.pid,
           key.user_stack_id, spres_error_message(res._what));
    return;
  }
  auto user_addrs = traced_addresses(user_stack);
  if (_show_samples) {
    PRINT_NFO("  user: %s", addresses_to_string(user_addrs).c_str());
  }

  if (key.kernel_stack_id >= 0) {
    RawStack kernel_stack;
    res = get_stack(stacks, key.kernel_stack_id, kernel_stack);
    if (IsSPResNotOK(res)) {
      ++_stats.kernel_stack_failures;
      LG_WRN("Kernel stack %d of pid %u unavailable (%s)",
             key.kernel_stack_id, key.pid, spres_error_message(res._what));
    } else if (_show_samples) {
      PRINT_NFO("  kernel: %s",
                addresses_to_string(traced_addresses(kernel_stack)).c_str());
    }
  }

  Sample sample;
  sample.values.push_back(static_cast<int64_t>(count));
  sample.location_ids.reserve(user_addrs.size());
  for (uint64_t addr : user_addrs) {
    sample.location_ids.push_back(add_or_get_location(key.pid, addr, profile));
  }
  profile.samples.push_back(std::move(sample));
  ++_stats.nb_samples;
}

uint64_t ProfileAssembler::add_or_get_location(uint32_t pid,
                                               ProcessAddress_t addr,
                                               Profile &profile) {
  auto [it, inserted] = _location_index.try_emplace(
      LocationKey{pid, addr},
      static_cast<LocationIdx_t>(profile.locations.size()));
  if (!inserted) {
    return profile.locations[it->second].id;
  }

  Location loc;
  loc.id = profile.locations.size() + 1;
  loc.address = addr;
  loc.mapping_idx = find_mapping(_mappings, addr);
  if (loc.mapping_idx == k_mapping_idx_null) {
    ++_stats.unmapped_locations;
    LG_WRN("Address 0x%lx of pid %u is outside of known mappings", addr, pid);
  }
  profile.locations.push_back(std::move(loc));
  return profile.locations.back().id;
}

void print_assembly_stats(const AssemblyStats &stats) {
  PRINT_NFO("Assembled %lu samples with %lu locations from %lu keys",
            stats.nb_samples, stats.nb_locations, stats.nb_keys);
  if (stats.other_pid_keys) {
    LG_NTC("Skipped %lu keys of other processes", stats.other_pid_keys);
  }
  if (stats.negative_user_stack || stats.user_stack_lookup_failures ||
      stats.user_stack_decode_failures || stats.kernel_stack_failures ||
      stats.unmapped_locations || stats.iteration_error) {
    LG_NTC("Dropped keys: negative_user_stack=%lu lookup=%lu decode=%lu, "
           "kernel_stack_failures=%lu unmapped_locations=%lu iteration_error=%s",
           stats.negative_user_stack, stats.user_stack_lookup_failures,
           stats.user_stack_decode_failures, stats.kernel_stack_failures,
           stats.unmapped_locations, stats.iteration_error ? "true" : "false");
  }
}

} // namespace stackprof
