// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "ddog_profiling_utils.hpp"
#include "defer.hpp"
#include "loghandle.hpp"
#include "pprof/stackprof_pprof.hpp"

#include <cstdlib>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

namespace stackprof {

namespace {
Profile fib_profile() {
  Profile profile = create_profile(std::chrono::seconds{10}, 100);
  Mapping mapping;
  mapping.id = 1;
  mapping.start = 0x401000;
  mapping.limit = 0x402000;
  mapping.offset = 0x1000;
  mapping.file = "/usr/bin/fib";
  mapping.build_id = "0123456789abcdef";
  profile.mappings.push_back(mapping);
  profile.locations.push_back(Location{1, 0x401136, 0, "fib"});
  profile.locations.push_back(Location{2, 0x401180, 0, "main"});
  profile.locations.push_back(Location{3, 0x7f0000001000, k_mapping_idx_null,
                                       ""});
  profile.samples.push_back(Sample{{42}, {1, 1, 2}});
  profile.samples.push_back(Sample{{7}, {3, 2}});
  return profile;
}

std::string_view slice_view(ddog_CharSlice slice) {
  return {slice.ptr, slice.len};
}

std::string temp_pprof_path() {
  char tmpl[] = "/tmp/stackprof_pprof_XXXXXX";
  int const fd = mkstemp(tmpl);
  if (fd != -1) {
    close(fd);
  }
  return tmpl;
}
} // namespace

TEST(StackprofPProf, WriteLocation) {
  Profile profile = fib_profile();
  ddog_prof_Location ffi_location;
  const Location &loc = profile.location(1);
  write_location(loc, profile.mapping_of(loc), &ffi_location);
  EXPECT_EQ(ffi_location.address, 0x401136UL);
  EXPECT_EQ(slice_view(ffi_location.function.name), "fib");
  EXPECT_EQ(ffi_location.mapping.memory_start, 0x401000UL);
  EXPECT_EQ(ffi_location.mapping.memory_limit, 0x402000UL);
  EXPECT_EQ(ffi_location.mapping.file_offset, 0x1000UL);
  EXPECT_EQ(slice_view(ffi_location.mapping.filename), "/usr/bin/fib");
  EXPECT_EQ(slice_view(ffi_location.mapping.build_id), "0123456789abcdef");
}

TEST(StackprofPProf, WriteUnmappedLocation) {
  Profile profile = fib_profile();
  ddog_prof_Location ffi_location;
  const Location &loc = profile.location(3);
  write_location(loc, profile.mapping_of(loc), &ffi_location);
  EXPECT_EQ(ffi_location.address, 0x7f0000001000UL);
  EXPECT_EQ(ffi_location.mapping.memory_start, 0UL);
  EXPECT_EQ(ffi_location.mapping.filename.len, 0UL);
  EXPECT_EQ(ffi_location.function.name.len, 0UL);
}

TEST(StackprofPProf, WriteFile) {
  LogHandle handle;
  std::string const path = temp_pprof_path();
  defer { unlink(path.c_str()); };
  Profile profile = fib_profile();
  ASSERT_TRUE(IsSPResOK(pprof_write_profile_file(profile, path)));

  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_GT(st.st_size, 0);
}

TEST(StackprofPProf, WriteEmptyProfile) {
  LogHandle handle;
  std::string const path = temp_pprof_path();
  defer { unlink(path.c_str()); };
  Profile profile = create_profile(std::chrono::seconds{1}, 100);
  EXPECT_TRUE(IsSPResOK(pprof_write_profile_file(profile, path)));
}

TEST(StackprofPProf, InvalidPath) {
  LogHandle handle;
  Profile profile = fib_profile();
  SPRes res =
      pprof_write_profile_file(profile, "/some/missing/dir/profile.pprof");
  EXPECT_TRUE(IsSPResFatal(res));
  EXPECT_EQ(res._what, SP_WHAT_PPROF);
}

} // namespace stackprof
