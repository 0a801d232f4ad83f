// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "hash_helper.hpp"
#include "profile.hpp"
#include "proc_maps.hpp"
#include "sample_tables.hpp"
#include "spres_def.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace stackprof {

struct AssemblyStats {
  uint64_t nb_keys{};
  uint64_t other_pid_keys{};
  uint64_t nb_samples{};
  uint64_t nb_locations{};
  uint64_t negative_user_stack{};
  uint64_t user_stack_lookup_failures{};
  uint64_t user_stack_decode_failures{};
  uint64_t kernel_stack_failures{};
  uint64_t unmapped_locations{};
  bool iteration_error{false};
};

// Turns raw (pid, stacks, count) aggregates into the samples, locations and
// mappings of a profile. Locations are shared by samples hitting the same
// (pid, address).
class ProfileAssembler {
public:
  explicit ProfileAssembler(MappingList mappings, bool show_samples = false)
      : _mappings(std::move(mappings)), _show_samples(show_samples) {}

  // Only keys of pid are assembled, all pids are kept by default
  void set_target_pid(uint32_t pid) { _target_pid = pid; }

  // Per key failures are logged and counted, they do not fail the pass.
  // A counts table iteration error is returned as a warning.
  SPRes fill(const CountsTable &counts, const StackTraceTable &stacks,
             Profile &profile);

  [[nodiscard]] const AssemblyStats &stats() const { return _stats; }

private:
  struct LocationKey {
    uint32_t pid;
    ProcessAddress_t addr;
    friend bool operator==(const LocationKey &, const LocationKey &) = default;
  };

  struct LocationKeyHash {
    std::size_t operator()(const LocationKey &k) const noexcept {
      return hash_values(k.pid, k.addr);
    }
  };

  void add_key(const StackCountKey &key, uint64_t count,
               const StackTraceTable &stacks, Profile &profile);

  uint64_t add_or_get_location(uint32_t pid, ProcessAddress_t addr,
                               Profile &profile);

  std::unordered_map<LocationKey, LocationIdx_t, LocationKeyHash>
      _location_index;
  MappingList _mappings;
  std::optional<uint32_t> _target_pid;
  AssemblyStats _stats;
  bool _show_samples;
};

void print_assembly_stats(const AssemblyStats &stats);

} // namespace stackprof
