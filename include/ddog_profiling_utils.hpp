// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "profile.hpp"

#include "datadog/common.h"
#include "datadog/profiling.h"

#include <string_view>

namespace stackprof {
inline ddog_CharSlice to_CharSlice(std::string_view str) {
  return {.ptr = str.data(), .len = str.size()};
}

void write_function(std::string_view function_name,
                    ddog_prof_Function *ffi_func);

void write_mapping(const Mapping &mapping, ddog_prof_Mapping *ffi_mapping);

// mapping can be null for addresses outside of known mappings
void write_location(const Location &loc, const Mapping *mapping,
                    ddog_prof_Location *ffi_location);

} // namespace stackprof
