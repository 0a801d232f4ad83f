// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "elf_symbols.hpp"
#include "loghandle.hpp"
#include "stackprof_base.hpp"

#include <algorithm>
#include <cstdio>
#include <elf.h>
#include <unistd.h>

extern "C" STACKPROF_NOINLINE int stackprof_elf_symbols_target() { return 42; }

namespace stackprof {

TEST(ElfSymbols, LoadSelf) {
  LogHandle handle;
  ElfSymbols elf_symbols;
  ASSERT_TRUE(IsSPResOK(load_elf_symbols("/proc/self/exe", elf_symbols)));
  EXPECT_FALSE(elf_symbols.symbols.empty());
  EXPECT_TRUE(std::ranges::any_of(elf_symbols.segments,
                                  [](const ElfSegment &segment) {
                                    return segment.type == PT_LOAD;
                                  }));

  auto it = std::ranges::find_if(elf_symbols.symbols, [](const ElfSymbol &sym) {
    return sym.name == "stackprof_elf_symbols_target";
  });
  ASSERT_NE(it, elf_symbols.symbols.end());
  EXPECT_NE(it->value, 0);
  EXPECT_EQ(stackprof_elf_symbols_target(), 42);
}

TEST(ElfSymbols, InvalidElf) {
  LogHandle handle;
  char path[] = "/tmp/stackprof_not_elf_XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(fd, -1);
  const char content[] = "this is not an elf file";
  ASSERT_EQ(write(fd, content, sizeof(content)),
            static_cast<ssize_t>(sizeof(content)));
  close(fd);

  ElfSymbols elf_symbols;
  SPRes res = load_elf_symbols(path, elf_symbols);
  EXPECT_TRUE(IsSPResFatal(res));
  EXPECT_EQ(res._what, SP_WHAT_INVALID_ELF);
  unlink(path);
}

TEST(ElfSymbols, MissingFile) {
  LogHandle handle;
  ElfSymbols elf_symbols;
  SPRes res = load_elf_symbols("/path/that/does/not/exist", elf_symbols);
  EXPECT_EQ(res._what, SP_WHAT_INVALID_ELF);
}

} // namespace stackprof
