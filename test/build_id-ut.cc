// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "build_id.hpp"
#include "elf_symbols.hpp"
#include "loghandle.hpp"

namespace stackprof {

TEST(build_id, format) {
  LogHandle handle;
  {
    const unsigned char build_id_tab[2] = {0x01, 0x01};
    BuildIdStr build_id_str(format_build_id(build_id_tab));
    EXPECT_EQ(build_id_str, std::string("0101"));
    LG_DBG("format = %s", build_id_str.c_str());
  }
  {
    const unsigned char build_id_tab[] = {
        0x94, 0x32, 0xac, 0x93, 0x9c, 0x01, 0x51, 0x59, 0xea, 0x37,
        0x5e, 0xc0, 0xa8, 0x75, 0x0d, 0xf9, 0x08, 0x05, 0x8a, 0x5a};
    BuildIdStr build_id_str(format_build_id(build_id_tab));
    LG_DBG("format = %s", build_id_str.c_str());
    EXPECT_EQ(build_id_str,
              std::string("9432ac939c015159ea375ec0a8750df908058a5a"));
  }
  {
    EXPECT_TRUE(format_build_id(BuildIdSpan{}).empty());
  }
}

TEST(build_id, missing_file) {
  LogHandle handle;
  EXPECT_FALSE(find_build_id("/path/that/does/not/exist").has_value());
}

TEST(build_id, self) {
  LogHandle handle;
  // test binaries are linked with --build-id
  auto build_id = find_build_id("/proc/self/exe");
  ASSERT_TRUE(build_id.has_value());
  EXPECT_FALSE(build_id->empty());
  EXPECT_EQ(build_id->find_first_not_of("0123456789abcdef"),
            std::string::npos);
}

} // namespace stackprof
