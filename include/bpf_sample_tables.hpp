// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "sample_tables.hpp"
#include "spres.hpp"
#include "unique_fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>

namespace stackprof {

// Routes libbpf diagnostics to the logger
void bpf_setup_logging();

// Walks a counts map with bpf style primitives (0 on success, errno set
// otherwise):
//   next_key(const StackCountKey *prev, StackCountKey *next)
//   lookup(const StackCountKey *key, uint64_t *count)
// A key that can no longer be read ends the walk with a warning, as asking the
// next key of a deleted key restarts from the first one.
template <typename NextKeyFunc, typename LookupFunc>
SPRes walk_counts_map(NextKeyFunc &&next_key, LookupFunc &&lookup,
                      const CountsVisitor &visitor, const char *map_name) {
  StackCountKey key = {};
  StackCountKey next = {};
  const StackCountKey *prev = nullptr;
  while (true) {
    if (next_key(prev, &next) != 0) {
      if (errno == ENOENT) {
        return {}; // end of map
      }
      SPRES_RETURN_WARN_LOG(SP_WHAT_BPF_MAP, "Unable to iterate %s (%s)",
                            map_name, strerror(errno));
    }
    uint64_t count = 0;
    if (lookup(&next, &count) != 0) {
      SPRES_RETURN_WARN_LOG(SP_WHAT_BPF_MAP,
                            "Entry of pid %u removed from %s during iteration "
                            "(%s)",
                            next.pid, map_name, strerror(errno));
    }
    visitor(next, count);
    key = next;
    prev = &key;
  }
}

// Counts table backed by a BPF hash map pinned in bpffs
class BpfCountsTable : public CountsTable {
public:
  static SPRes open(const std::string &pin_path, BpfCountsTable &table);

  SPRes iterate(const CountsVisitor &visitor) const override;

private:
  UniqueFd _map_fd;
  std::string _pin_path;
};

// Stack trace table backed by a pinned BPF_MAP_TYPE_STACK_TRACE map
class BpfStackTraceTable : public StackTraceTable {
public:
  static SPRes open(const std::string &pin_path, BpfStackTraceTable &table);

  SPRes lookup(int32_t stack_id, std::vector<std::byte> &bytes) const override;

private:
  UniqueFd _map_fd;
  std::string _pin_path;
  uint32_t _value_size{};
};

} // namespace stackprof
