// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "proc_maps.hpp"
#include "stackprof_defs.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stackprof {

struct ValueType {
  std::string type;
  std::string unit;
};

struct Location {
  uint64_t id{}; // 1 based, index + 1 in the location list
  ProcessAddress_t address{};
  MappingIdx_t mapping_idx{k_mapping_idx_null};
  std::string function_name; // filled by symbolization
};

struct Sample {
  std::vector<int64_t> values;
  std::vector<uint64_t> location_ids; // most recent first
};

struct Profile {
  int64_t time_nanos{};
  int64_t duration_nanos{};
  ValueType sample_type;
  ValueType period_type;
  int64_t period{};
  MappingList mappings;
  std::vector<Location> locations;
  std::vector<Sample> samples;

  [[nodiscard]] const Location &location(uint64_t id) const {
    return locations[id - 1];
  }
  [[nodiscard]] const Mapping *mapping_of(const Location &loc) const {
    return loc.mapping_idx == k_mapping_idx_null ? nullptr
                                                 : &mappings[loc.mapping_idx];
  }
};

inline constexpr std::string_view k_sample_type = "samples";
inline constexpr std::string_view k_sample_unit = "count";
inline constexpr std::string_view k_period_type = "cpu";
inline constexpr std::string_view k_period_unit = "nanoseconds";

// Nanoseconds between two samples at the given frequency
int64_t period_from_frequency(uint32_t frequency);

// Empty profile stamped with the current time
Profile create_profile(std::chrono::nanoseconds duration, uint32_t frequency);

// Root first frames separated by ';' (function name, or address)
std::string sample_to_string(const Profile &profile, const Sample &sample);

void print_samples(const Profile &profile);

} // namespace stackprof
