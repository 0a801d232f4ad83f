// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "profile.hpp"

#include "logger.hpp"

#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace stackprof {

int64_t period_from_frequency(uint32_t frequency) {
  if (frequency == 0) {
    frequency = k_default_sampling_frequency;
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::seconds{1})
             .count() /
      frequency;
}

Profile create_profile(std::chrono::nanoseconds duration, uint32_t frequency) {
  Profile profile;
  profile.time_nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  profile.duration_nanos = duration.count();
  profile.sample_type = ValueType{std::string{k_sample_type},
                                  std::string{k_sample_unit}};
  profile.period_type = ValueType{std::string{k_period_type},
                                  std::string{k_period_unit}};
  profile.period = period_from_frequency(frequency);
  return profile;
}

std::string sample_to_string(const Profile &profile, const Sample &sample) {
  return absl::StrJoin(
      sample.location_ids.rbegin(), sample.location_ids.rend(), ";",
      [&profile](std::string *out, uint64_t id) {
        const Location &loc = profile.location(id);
        if (loc.function_name.empty()) {
          absl::StrAppendFormat(out, "0x%x", loc.address);
        } else {
          out->append(loc.function_name);
        }
      });
}

void print_samples(const Profile &profile) {
  for (const auto &sample : profile.samples) {
    PRINT_NFO("%s %ld", sample_to_string(profile, sample).c_str(),
              sample.values.empty() ? 0 : sample.values[0]);
  }
}

} // namespace stackprof
