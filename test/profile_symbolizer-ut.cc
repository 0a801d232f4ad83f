// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "loghandle.hpp"
#include "proc_maps.hpp"
#include "profile_symbolizer.hpp"
#include "stackprof_base.hpp"

#include <elf.h>
#include <unistd.h>

extern "C" STACKPROF_NOINLINE int stackprof_symbolizer_target(int val) {
  return val * 3;
}

namespace stackprof {

namespace {
ElfSymbols fib_symbols() {
  ElfSymbols symbols;
  symbols.segments.push_back(ElfSegment{PT_LOAD, 0x1000, 0x401000});
  symbols.symbols.push_back(ElfSymbol{"main", 0x401180});
  symbols.symbols.push_back(ElfSymbol{"fib", 0x401136});
  return symbols;
}
} // namespace

TEST(ProfileSymbolizer, OnlyExecutableMapping) {
  LogHandle handle;
  AddrResolver resolver;
  ASSERT_TRUE(
      IsSPResOK(AddrResolver::create(fib_symbols(), 0x1000, 0x401000, resolver)));

  Profile profile = create_profile(std::chrono::seconds{1}, 100);
  profile.mappings.resize(2);
  profile.locations.push_back(Location{1, 0x401140, 0, ""});
  profile.locations.push_back(Location{2, 0x401190, 0, ""});
  profile.locations.push_back(Location{3, 0x7f0000002000, 1, ""});
  profile.locations.push_back(Location{4, 0x500000, k_mapping_idx_null, ""});

  EXPECT_EQ(symbolize_profile(profile, 0, resolver), 2U);
  EXPECT_EQ(profile.locations[0].function_name, "fib");
  // past the last symbol
  EXPECT_EQ(profile.locations[1].function_name, "unknown");
  EXPECT_TRUE(profile.locations[2].function_name.empty());
  EXPECT_TRUE(profile.locations[3].function_name.empty());
}

TEST(ProfileSymbolizer, NoExecutableMapping) {
  LogHandle handle;
  AddrResolver resolver;
  ASSERT_TRUE(
      IsSPResOK(AddrResolver::create(fib_symbols(), 0x1000, 0x401000, resolver)));
  Profile profile = create_profile(std::chrono::seconds{1}, 100);
  profile.locations.push_back(Location{1, 0x401140, k_mapping_idx_null, ""});
  EXPECT_EQ(symbolize_profile(profile, k_mapping_idx_null, resolver), 0U);
  EXPECT_TRUE(profile.locations[0].function_name.empty());
}

TEST(ProfileSymbolizer, SelfResolver) {
  LogHandle handle;
  MappingList mappings;
  ASSERT_TRUE(IsSPResOK(parse_proc_maps(getpid(), mappings)));

  AddrResolver resolver;
  MappingIdx_t exe_mapping_idx = k_mapping_idx_null;
  SPRes res = create_exe_resolver(getpid(), mappings, exe_mapping_idx, resolver);
  ASSERT_TRUE(IsSPResOK(res));
  ASSERT_NE(exe_mapping_idx, k_mapping_idx_null);

  auto addr = reinterpret_cast<ProcessAddress_t>(&stackprof_symbolizer_target);
  EXPECT_TRUE(mappings[exe_mapping_idx].contains(addr));
  EXPECT_EQ(resolver.resolve(addr), "stackprof_symbolizer_target");
  EXPECT_EQ(stackprof_symbolizer_target(2), 6);
}

TEST(ProfileSymbolizer, MissingProcess) {
  LogHandle handle;
  AddrResolver resolver;
  MappingIdx_t exe_mapping_idx = k_mapping_idx_null;
  SPRes res = create_exe_resolver(0x7ffffff0, MappingList{}, exe_mapping_idx,
                                  resolver);
  EXPECT_TRUE(IsSPResNotOK(res));
  EXPECT_FALSE(IsSPResFatal(res));
  EXPECT_EQ(res._what, SP_WHAT_SYMBOLIZER);
}

TEST(ProfileSymbolizer, ExecutableNotMapped) {
  LogHandle handle;
  AddrResolver resolver;
  MappingIdx_t exe_mapping_idx = k_mapping_idx_null;
  // self exists but the mapping list is empty
  SPRes res =
      create_exe_resolver(getpid(), MappingList{}, exe_mapping_idx, resolver);
  EXPECT_TRUE(IsSPResNotOK(res));
  EXPECT_EQ(exe_mapping_idx, k_mapping_idx_null);
}

} // namespace stackprof
