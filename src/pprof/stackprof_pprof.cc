// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "pprof/stackprof_pprof.hpp"

#include "ddog_profiling_utils.hpp"
#include "defer.hpp"
#include "logger.hpp"
#include "spres.hpp"
#include "unique_fd.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace stackprof {

namespace {

ddog_Timespec to_timespec(int64_t time_nanos) {
  const std::chrono::nanoseconds ns{time_nanos};
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(ns);
  return {.seconds = secs.count(),
          .nanoseconds = static_cast<uint32_t>((ns - secs).count())};
}

SPRes add_sample(const Profile &profile, const Sample &sample,
                 ddog_prof_Profile *ffi_profile) {
  std::array<ddog_prof_Location, k_max_stack_depth> locations_buff;
  size_t write_index = 0;
  for (uint64_t id : sample.location_ids) {
    if (write_index >= locations_buff.size()) {
      LG_DBG("Truncating sample at %zu frames", write_index);
      break;
    }
    const Location &loc = profile.location(id);
    write_location(loc, profile.mapping_of(loc), &locations_buff[write_index]);
    ++write_index;
  }

  ddog_prof_Sample const ffi_sample = {
      .locations = {.ptr = locations_buff.data(), .len = write_index},
      .values = {.ptr = sample.values.data(), .len = sample.values.size()},
      .labels = {.ptr = nullptr, .len = 0},
  };

  auto res = ddog_prof_Profile_add(ffi_profile, ffi_sample, 0);
  if (res.tag != DDOG_PROF_PROFILE_RESULT_OK) {
    defer { ddog_Error_drop(&res.err); };
    auto msg = ddog_Error_message(&res.err);
    SPRES_RETURN_ERROR_LOG(SP_WHAT_PPROF, "Unable to add sample: %.*s",
                           static_cast<int>(msg.len), msg.ptr);
  }
  return {};
}

SPRes write_buffer(const ddog_Vec_U8 &buffer, int fd) {
  size_t written = 0;
  while (written < buffer.len) {
    ssize_t const ret = write(fd, buffer.ptr + written, buffer.len - written);
    if (ret < 0 && errno == EINTR) {
      continue;
    }
    if (ret <= 0) {
      SPRES_RETURN_ERROR_LOG(SP_WHAT_PPROF, "Failed to write pprof (%s)",
                             strerror(errno));
    }
    written += static_cast<size_t>(ret);
  }
  return {};
}

} // namespace

SPRes pprof_write_profile(const Profile &profile, int fd) {
  const ddog_prof_ValueType sample_type = {
      .type_ = to_CharSlice(profile.sample_type.type),
      .unit = to_CharSlice(profile.sample_type.unit),
  };
  const ddog_prof_Slice_ValueType sample_types = {.ptr = &sample_type,
                                                  .len = 1};
  const ddog_prof_Period period = {
      .type_ =
          {
              .type_ = to_CharSlice(profile.period_type.type),
              .unit = to_CharSlice(profile.period_type.unit),
          },
      .value = profile.period,
  };
  const ddog_Timespec start_time = to_timespec(profile.time_nanos);

  auto prof_res = ddog_prof_Profile_new(sample_types, &period, &start_time);
  if (prof_res.tag != DDOG_PROF_PROFILE_NEW_RESULT_OK) {
    ddog_Error_drop(&prof_res.err);
    SPRES_RETURN_ERROR_LOG(SP_WHAT_PPROF, "Unable to create new profile");
  }
  ddog_prof_Profile ffi_profile = prof_res.ok;
  defer { ddog_prof_Profile_drop(&ffi_profile); };

  for (const auto &sample : profile.samples) {
    SPRES_CHECK_FWD(add_sample(profile, sample, &ffi_profile));
  }

  const int64_t duration_nanos = profile.duration_nanos;
  const ddog_Timespec end_time =
      to_timespec(profile.time_nanos + profile.duration_nanos);
  ddog_prof_Profile_SerializeResult serialized_result =
      ddog_prof_Profile_serialize(&ffi_profile, &end_time, &duration_nanos,
                                  nullptr);
  if (serialized_result.tag != DDOG_PROF_PROFILE_SERIALIZE_RESULT_OK) {
    defer { ddog_Error_drop(&serialized_result.err); };
    auto msg = ddog_Error_message(&serialized_result.err);
    SPRES_RETURN_ERROR_LOG(SP_WHAT_PPROF, "Failed to serialize: %.*s",
                           static_cast<int>(msg.len), msg.ptr);
  }
  ddog_prof_EncodedProfile *encoded_profile = &serialized_result.ok;
  defer { ddog_prof_EncodedProfile_drop(encoded_profile); };

  SPRES_CHECK_FWD(write_buffer(encoded_profile->buffer, fd));
  LG_DBG("Wrote pprof of %zu samples (%zu bytes)", profile.samples.size(),
         encoded_profile->buffer.len);
  return {};
}

SPRes pprof_write_profile_file(const Profile &profile,
                               const std::string &path) {
  constexpr int read_write_user_group = 0640;
  UniqueFd fd{::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC,
                     read_write_user_group)};
  if (!fd) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_PPROF, "Unable to create %s (%s)",
                           path.c_str(), strerror(errno));
  }
  SPRES_CHECK_FWD(pprof_write_profile(profile, fd.get()));
  LG_NTC("Profile written to %s", path.c_str());
  return {};
}

} // namespace stackprof
