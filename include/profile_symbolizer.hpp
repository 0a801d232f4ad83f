// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "addr_resolver.hpp"
#include "profile.hpp"
#include "spres_def.hpp"

#include <sys/types.h>

namespace stackprof {

// Attaches resolver names to the locations of the executable mapping.
// Returns the number of symbolized locations.
size_t symbolize_profile(Profile &profile, MappingIdx_t exe_mapping_idx,
                         const AddrResolver &resolver);

// Builds a resolver for the main executable of pid from its mapping
SPRes create_exe_resolver(pid_t pid, const MappingList &mappings,
                          MappingIdx_t &exe_mapping_idx,
                          AddrResolver &resolver,
                          const char *path_to_proc = "");

} // namespace stackprof
