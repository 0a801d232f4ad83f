// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "build_id.hpp"
#include "spres_def.hpp"
#include "stackprof_defs.hpp"

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace stackprof {

// One region of a process address space, as read from /proc/<pid>/maps
struct Mapping {
  uint64_t id{}; // 0 until the profile assigns ids
  ProcessAddress_t start{};
  ProcessAddress_t limit{}; // exclusive
  Offset_t offset{};
  std::string file;
  BuildIdStr build_id;
  inode_t inode{};
  uint32_t prot{}; // PROT_READ / PROT_WRITE / PROT_EXEC

  [[nodiscard]] bool contains(ProcessAddress_t addr) const {
    return start <= addr && addr < limit;
  }
  [[nodiscard]] bool is_exec() const;
  [[nodiscard]] bool is_file_backed() const {
    return !file.empty() && file[0] == '/';
  }
};

using MappingList = std::vector<Mapping>;

// Parses one line of a maps file, nullopt on a malformed line
std::optional<Mapping> mapping_from_proc_line(const char *line);

// Reads the executable mappings of pid.
// path_to_proc allows reading a maps file under another root (tests)
SPRes parse_proc_maps(pid_t pid, MappingList &mappings,
                      const char *path_to_proc = "");

// Index of the first mapping containing addr, k_mapping_idx_null otherwise
MappingIdx_t find_mapping(const MappingList &mappings, ProcessAddress_t addr);

// Index of the first executable mapping backed by file
MappingIdx_t find_mapping_by_file(const MappingList &mappings,
                                  std::string_view file);

std::string mapping_to_string(const Mapping &mapping);

void print_mappings(const MappingList &mappings);

} // namespace stackprof
