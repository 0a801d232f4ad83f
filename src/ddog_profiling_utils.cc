// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "ddog_profiling_utils.hpp"

namespace stackprof {

void write_function(std::string_view function_name,
                    ddog_prof_Function *ffi_func) {
  ffi_func->name = to_CharSlice(function_name);
  ffi_func->system_name = {.ptr = nullptr, .len = 0};
  ffi_func->filename = {.ptr = nullptr, .len = 0};
}

void write_mapping(const Mapping &mapping, ddog_prof_Mapping *ffi_mapping) {
  ffi_mapping->memory_start = mapping.start;
  ffi_mapping->memory_limit = mapping.limit;
  ffi_mapping->file_offset = mapping.offset;
  ffi_mapping->filename = to_CharSlice(mapping.file);
  ffi_mapping->build_id = to_CharSlice(mapping.build_id);
}

void write_location(const Location &loc, const Mapping *mapping,
                    ddog_prof_Location *ffi_location) {
  if (mapping) {
    write_mapping(*mapping, &ffi_location->mapping);
  } else {
    ffi_location->mapping = {};
  }
  write_function(loc.function_name, &ffi_location->function);
  ffi_location->address = loc.address;
  ffi_location->line = 0;
}

} // namespace stackprof
