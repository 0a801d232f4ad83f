// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "proc_maps.hpp"

#include "defer.hpp"
#include "elf_symbols.hpp"
#include "logger.hpp"
#include "signal_helper.hpp"
#include "spres.hpp"
#include "unique_fd.hpp"

#include <absl/strings/str_format.h>
#include <algorithm>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <string_view>
#include <sys/mman.h>
#include <unordered_map>

namespace stackprof {

namespace {

uint32_t mode_string_to_prot(const char mode[4]) {
  return ((mode[0] == 'r') ? PROT_READ : 0) |
      ((mode[1] == 'w') ? PROT_WRITE : 0) | ((mode[2] == 'x') ? PROT_EXEC : 0);
}

UniqueFile open_proc_maps(int pid, const char *path_to_proc) {
  char proc_map_filename[PATH_MAX] = {};
  auto n = snprintf(proc_map_filename, std::size(proc_map_filename),
                    "%s/proc/%d/maps", path_to_proc, pid);
  if (n < 0 || n >= static_cast<ssize_t>(std::size(proc_map_filename))) {
    return {};
  }
  return UniqueFile{fopen(proc_map_filename, "r")};
}

void fill_build_ids(MappingList &mappings) {
  std::unordered_map<std::string, BuildIdStr> build_id_cache;
  for (auto &mapping : mappings) {
    if (!mapping.is_file_backed()) {
      continue;
    }
    auto it = build_id_cache.find(mapping.file);
    if (it == build_id_cache.end()) {
      auto build_id = find_build_id(mapping.file);
      it = build_id_cache.emplace(mapping.file, build_id.value_or(BuildIdStr{}))
               .first;
    }
    mapping.build_id = it->second;
  }
}

} // namespace

bool Mapping::is_exec() const { return prot & PROT_EXEC; }

std::optional<Mapping> mapping_from_proc_line(const char *line) {
  // clang-format off
  // Example of format
  /*
    55d78839f000-55d7883a1000 r--p 00000000 fe:01 3287864                    /usr/local/bin/BadBoggleSolver_run
    55d7883a1000-55d7883a5000 r-xp 00002000 fe:01 3287864                    /usr/local/bin/BadBoggleSolver_run
    ...
    55d78a12b000-55d78a165000 rw-p 00000000 00:00 0                          [heap]
    ...
    7ffcd6ce6000-7ffcd6ce8000 r-xp 00000000 00:00 0                          [vdso]
  */
  // clang-format on
  uint64_t m_start = 0;
  uint64_t m_end = 0;
  uint64_t m_off = 0;
  char m_mode[4] = {0};
  int m_p = 0;
  uint32_t m_dev_major = 0;
  uint32_t m_dev_minor = 0;
  uint64_t m_inode = 0;

  // %n specifier does not increase count returned by sscanf
  constexpr int k_expected_number_of_matches = 7;
  if (k_expected_number_of_matches !=
      // NOLINTNEXTLINE(cert-err34-c)
      sscanf(line, "%lx-%lx %4c %lx %x:%x %lu%n", &m_start, &m_end, m_mode,
             &m_off, &m_dev_major, &m_dev_minor, &m_inode, &m_p)) {
    LG_ERR("[MAPS] Failed to scan proc line: %s", line);
    return std::nullopt;
  }
  if (m_end < m_start) {
    LG_ERR("[MAPS] Invalid range in proc line: %s", line);
    return std::nullopt;
  }

  // trim spaces on the left
  std::string_view remaining{line + m_p};
  remaining.remove_prefix(
      +std::min(remaining.find_first_not_of(" \t"), remaining.size()));
  // remove new line at end if present
  if (remaining.ends_with('\n')) {
    remaining.remove_suffix(1);
  }

  Mapping mapping;
  mapping.start = m_start;
  mapping.limit = m_end;
  mapping.offset = m_off;
  mapping.file = std::string(remaining);
  mapping.inode = m_inode;
  mapping.prot = mode_string_to_prot(m_mode);
  return mapping;
}

SPRes parse_proc_maps(pid_t pid, MappingList &mappings,
                      const char *path_to_proc) {
  auto proc_maps_file = open_proc_maps(pid, path_to_proc);
  if (!proc_maps_file) {
    if (!process_is_alive(pid)) {
      SPRES_RETURN_ERROR_LOG(SP_WHAT_PROCMAPS, "[MAPS] Process %d not found",
                             pid);
    }
    SPRES_RETURN_ERROR_LOG(SP_WHAT_PROCMAPS,
                           "[MAPS] Unable to open maps of process %d", pid);
  }

  char *buf = nullptr;
  defer { free(buf); };
  size_t sz_buf = 0;

  MappingList result;
  while (-1 != getline(&buf, &sz_buf, proc_maps_file.get())) {
    auto mapping = mapping_from_proc_line(buf);
    if (!mapping || !mapping->is_exec()) {
      continue;
    }
    result.push_back(std::move(*mapping));
  }
  fill_build_ids(result);
  LG_DBG("[MAPS] Found %zu executable mappings for process %d", result.size(),
         pid);
  mappings = std::move(result);
  return {};
}

MappingIdx_t find_mapping(const MappingList &mappings, ProcessAddress_t addr) {
  auto it = std::ranges::find_if(
      mappings, [addr](const Mapping &m) { return m.contains(addr); });
  return it == mappings.end()
      ? k_mapping_idx_null
      : static_cast<MappingIdx_t>(it - mappings.begin());
}

MappingIdx_t find_mapping_by_file(const MappingList &mappings,
                                  std::string_view file) {
  auto it = std::ranges::find_if(mappings, [file](const Mapping &m) {
    return m.is_exec() && m.file == file;
  });
  return it == mappings.end()
      ? k_mapping_idx_null
      : static_cast<MappingIdx_t>(it - mappings.begin());
}

std::string mapping_to_string(const Mapping &mapping) {
  return absl::StrFormat("start=0x%x limit=0x%x offset=0x%x %s", mapping.start,
                         mapping.limit, mapping.offset, mapping.file);
}

void print_mappings(const MappingList &mappings) {
  PRINT_NFO("Mappings (%zu):", mappings.size());
  for (const auto &mapping : mappings) {
    PRINT_NFO("  %s", mapping_to_string(mapping).c_str());
  }
}

} // namespace stackprof
