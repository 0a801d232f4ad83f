// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profile_symbolizer.hpp"

#include "logger.hpp"
#include "spres.hpp"

#include <absl/strings/str_cat.h>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <unistd.h>

namespace stackprof {

size_t symbolize_profile(Profile &profile, MappingIdx_t exe_mapping_idx,
                         const AddrResolver &resolver) {
  if (exe_mapping_idx == k_mapping_idx_null) {
    return 0;
  }
  size_t nb_symbolized = 0;
  for (auto &loc : profile.locations) {
    if (loc.mapping_idx != exe_mapping_idx) {
      continue;
    }
    loc.function_name = std::string{resolver.resolve(loc.address)};
    ++nb_symbolized;
  }
  LG_DBG("Symbolized %zu/%zu locations", nb_symbolized,
         profile.locations.size());
  return nb_symbolized;
}

SPRes create_exe_resolver(pid_t pid, const MappingList &mappings,
                          MappingIdx_t &exe_mapping_idx,
                          AddrResolver &resolver, const char *path_to_proc) {
  std::string const exe_link = absl::StrCat(path_to_proc, "/proc/", pid, "/exe");
  std::array<char, PATH_MAX> exe_path{};
  ssize_t const len =
      readlink(exe_link.c_str(), exe_path.data(), exe_path.size() - 1);
  if (len <= 0) {
    SPRES_RETURN_WARN_LOG(SP_WHAT_SYMBOLIZER, "Unable to read link %s (%s)",
                          exe_link.c_str(), strerror(errno));
  }
  std::string_view const exe_file{exe_path.data(), static_cast<size_t>(len)};

  exe_mapping_idx = find_mapping_by_file(mappings, exe_file);
  if (exe_mapping_idx == k_mapping_idx_null) {
    SPRES_RETURN_WARN_LOG(SP_WHAT_SYMBOLIZER,
                          "No executable mapping for %.*s",
                          static_cast<int>(exe_file.size()), exe_file.data());
  }
  const Mapping &exe_mapping = mappings[exe_mapping_idx];
  // the exe link stays valid if the file was replaced on disk
  SPRes const res = AddrResolver::create_from_file(
      exe_link, exe_mapping.offset, exe_mapping.start, resolver);
  if (IsSPResNotOK(res)) {
    exe_mapping_idx = k_mapping_idx_null;
    return spres_warn(res._what);
  }
  LG_NFO("Symbolizing %s (offset=0x%lx start=0x%lx)", exe_mapping.file.c_str(),
         exe_mapping.offset, exe_mapping.start);
  return {};
}

} // namespace stackprof
