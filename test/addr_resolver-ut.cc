// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "addr_resolver.hpp"
#include "loghandle.hpp"
#include "proc_maps.hpp"
#include "stackprof_base.hpp"

#include <elf.h>
#include <unistd.h>

extern "C" STACKPROF_NOINLINE int stackprof_resolver_target(int n) {
  // keep a body large enough to hold an address past the entry point
  int res = 0;
  for (int i = 0; i < n; ++i) {
    res += i * n;
  }
  return res;
}

namespace stackprof {

namespace {
constexpr Offset_t k_file_offset = 0x1000;
constexpr ProcessAddress_t k_memory_start = 0x401000;

// Two functions in a PIE executable (vaddr == offset)
ElfSymbols pie_symbols() {
  ElfSymbols elf_symbols;
  elf_symbols.symbols = {{"main", 0x1000}, {"fib", 0x1010}};
  elf_symbols.segments = {{PT_LOAD, 0x0, 0x0},
                          {PT_LOAD, k_file_offset, k_file_offset}};
  return elf_symbols;
}

// Same functions linked at a fixed address
ElfSymbols non_pie_symbols() {
  ElfSymbols elf_symbols;
  elf_symbols.symbols = {{"fib", 0x401010}, {"main", 0x401000}};
  elf_symbols.segments = {{PT_LOAD, 0x0, 0x400000},
                          {PT_LOAD, k_file_offset, k_memory_start}};
  return elf_symbols;
}
} // namespace

TEST(AddrResolver, PieScenario) {
  LogHandle handle;
  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(AddrResolver::create(pie_symbols(), k_file_offset,
                                             k_memory_start, resolver)));
  EXPECT_TRUE(resolver.is_pie());
  EXPECT_EQ(resolver.resolve(0x401010), "fib");
  EXPECT_EQ(resolver.resolve(0x401000), "main");
  // gap between the two symbols is credited to the first one
  EXPECT_EQ(resolver.resolve(0x401008), "main");
  // search runs past the last symbol
  EXPECT_EQ(resolver.resolve(0x401020), k_unknown_symbol);
}

TEST(AddrResolver, PieBelowMemoryStart) {
  LogHandle handle;
  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(AddrResolver::create(pie_symbols(), k_file_offset,
                                             k_memory_start, resolver)));
  EXPECT_EQ(resolver.resolve(k_memory_start - 1), k_unknown_symbol);
  EXPECT_EQ(resolver.resolve(0x1010), k_unknown_symbol);
  EXPECT_EQ(resolver.resolve(0), k_unknown_symbol);
}

TEST(AddrResolver, NonPie) {
  LogHandle handle;
  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(AddrResolver::create(
      non_pie_symbols(), k_file_offset, k_memory_start, resolver)));
  EXPECT_FALSE(resolver.is_pie());
  EXPECT_EQ(resolver.resolve(0x401000), "main");
  EXPECT_EQ(resolver.resolve(0x40100f), "main");
  EXPECT_EQ(resolver.resolve(0x401010), "fib");
  // before the first symbol there is no preceding symbol
  EXPECT_EQ(resolver.resolve(0x400000), k_unknown_symbol);
  EXPECT_EQ(resolver.resolve(0), k_unknown_symbol);
}

TEST(AddrResolver, ZeroValuedPrecedingSymbol) {
  LogHandle handle;
  ElfSymbols elf_symbols;
  elf_symbols.symbols = {{"crtstuff.c", 0}, {"after", 0x2000}};
  elf_symbols.segments = {{PT_LOAD, 0x0, 0x400000}};
  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(
      AddrResolver::create(std::move(elf_symbols), 0, 0x400000, resolver)));
  EXPECT_EQ(resolver.resolve(0x1000), k_unknown_symbol);
  EXPECT_EQ(resolver.resolve(0x2000), "after");
}

TEST(AddrResolver, EqualValuesKeepFileOrder) {
  LogHandle handle;
  ElfSymbols elf_symbols;
  elf_symbols.symbols = {
      {"alias_first", 0x500}, {"alias_second", 0x500}, {"before", 0x100}};
  elf_symbols.segments = {{PT_LOAD, 0x0, 0x400000}};
  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(
      AddrResolver::create(std::move(elf_symbols), 0, 0x400000, resolver)));
  EXPECT_EQ(resolver.resolve(0x500), "alias_first");
  EXPECT_EQ(resolver.resolve(0x400), "before");
  EXPECT_EQ(resolver.nb_symbols(), 3U);
}

TEST(AddrResolver, Idempotent) {
  LogHandle handle;
  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(AddrResolver::create(pie_symbols(), k_file_offset,
                                             k_memory_start, resolver)));
  for (ProcessAddress_t addr = k_memory_start - 4; addr < k_memory_start + 0x30;
       ++addr) {
    EXPECT_EQ(resolver.resolve(addr), resolver.resolve(addr));
  }
}

TEST(AddrResolver, NoMatchingLoadSegment) {
  LogHandle handle;
  AddrResolver resolver;
  SPRes res =
      AddrResolver::create(pie_symbols(), 0x2000, k_memory_start, resolver);
  EXPECT_TRUE(IsSPResFatal(res));
  EXPECT_EQ(res._what, SP_WHAT_NO_MATCHING_LOAD_SEGMENT);

  // only LOAD segments are considered
  ElfSymbols elf_symbols = pie_symbols();
  elf_symbols.segments = {{PT_NOTE, k_file_offset, k_file_offset}};
  res = AddrResolver::create(std::move(elf_symbols), k_file_offset,
                             k_memory_start, resolver);
  EXPECT_EQ(res._what, SP_WHAT_NO_MATCHING_LOAD_SEGMENT);
}

TEST(AddrResolver, MissingFile) {
  LogHandle handle;
  AddrResolver resolver;
  SPRes res = AddrResolver::create_from_file("/path/that/does/not/exist",
                                             k_file_offset, k_memory_start,
                                             resolver);
  EXPECT_TRUE(IsSPResFatal(res));
  EXPECT_EQ(res._what, SP_WHAT_INVALID_ELF);
}

TEST(AddrResolver, SelfExecutable) {
  LogHandle handle;
  MappingList mappings;
  ASSERT_TRUE(IsSPResOK(parse_proc_maps(getpid(), mappings)));
  const auto target_addr =
      reinterpret_cast<ProcessAddress_t>(&stackprof_resolver_target);
  MappingIdx_t const idx = find_mapping(mappings, target_addr);
  ASSERT_NE(idx, k_mapping_idx_null);
  const Mapping &mapping = mappings[idx];
  LG_DBG("Test mapping: %s", mapping_to_string(mapping).c_str());

  AddrResolver resolver;
  ASSERT_TRUE(IsSPResOK(AddrResolver::create_from_file(
      "/proc/self/exe", mapping.offset, mapping.start, resolver)));
  EXPECT_EQ(resolver.resolve(target_addr), "stackprof_resolver_target");
  EXPECT_EQ(resolver.resolve(target_addr + 1), "stackprof_resolver_target");
  EXPECT_GT(stackprof_resolver_target(3), 0);
}

} // namespace stackprof
