// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "loghandle.hpp"
#include "spres.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>

namespace stackprof {

TEST(SPRes, Size) {
  SPRes spres = {};
  ASSERT_TRUE(sizeof(spres) == sizeof(int32_t));
}

TEST(SPRes, InitOK) {
  SPRes spres1 = {};
  SPRes spres2 = spres_init();

  ASSERT_TRUE(spres_equal(spres1, spres2));
  ASSERT_FALSE(IsSPResNotOK(spres2));
  ASSERT_TRUE(IsSPResOK(spres2));
}

namespace {
int s_call_counter = 0;

SPRes mock_fatal_generator() {
  ++s_call_counter;
  SPRES_RETURN_ERROR_LOG(SP_WHAT_PPROF,
                         "Test the log and return function %d", 42);
}

SPRes mock_warn_generator() {
  SPRES_RETURN_WARN_LOG(SP_WHAT_STACK_LOOKUP, "Some soft error");
}

SPRes sperr_wrapper() {
  SPRES_CHECK_FWD(mock_fatal_generator());
  return spres_init();
}

SPRes spwarn_wrapper(bool &reached_end) {
  SPRES_CHECK_FWD(mock_warn_generator());
  reached_end = true;
  return spres_init();
}

int minus_one_generator() {
  errno = ENOENT;
  return -1;
}

bool false_generator() { return false; }
} // namespace

TEST(SPRes, FillFatal) {
  {
    SPRes spres = spres_error(SP_WHAT_PPROF);
    ASSERT_TRUE(IsSPResNotOK(spres));
    ASSERT_TRUE(IsSPResFatal(spres));
  }
  {
    LogHandle handle;
    {
      SPRes spres = mock_fatal_generator();
      ASSERT_TRUE(spres_equal(spres, spres_error(SP_WHAT_PPROF)));
    }
    EXPECT_EQ(s_call_counter, 1);

    {
      SPRes spres = sperr_wrapper();
      ASSERT_TRUE(spres_equal(spres, spres_error(SP_WHAT_PPROF)));
    }
    EXPECT_EQ(s_call_counter, 2);
  }
}

TEST(SPRes, WarningsAreRecoverable) {
  LogHandle handle;
  bool reached_end = false;
  SPRes spres = spwarn_wrapper(reached_end);
  EXPECT_TRUE(IsSPResOK(spres));
  EXPECT_TRUE(reached_end);

  spres = mock_warn_generator();
  EXPECT_EQ(spres, spres_warn(SP_WHAT_STACK_LOOKUP));
  EXPECT_FALSE(IsSPResFatal(spres));
}

namespace {
void mock_except1() { throw SPException(spres_error(SP_WHAT_PPROF)); }

void mock_except2() { throw std::bad_alloc(); }

void mock_except3() { throw std::length_error("too long"); }

SPRes mock_wrapper(int idx) {
  try {
    if (idx == 1) {
      mock_except1();
    } else if (idx == 2) {
      mock_except2();
    } else if (idx == 3) {
      SPRES_CHECK_ERRNO(minus_one_generator(), SP_WHAT_PPROF,
                        "minus one returned");
    } else if (idx == 4) {
      LG_NTC("all good");
    } else if (idx == 5) {
      SPRES_CHECK_BOOL(false_generator(), SP_WHAT_PPROF,
                       "False returned from generator");
    } else if (idx == 6) {
      mock_except3();
    } else if (idx == 7) {
      throw SPException(spres_warn(SP_WHAT_STACK_LOOKUP));
    }
  }
  CatchExcept2SPRes();
  return spres_init();
}
} // namespace

TEST(SPRes, ConvertException) {
  LogHandle handle;
  SPRes spres = mock_wrapper(1);
  ASSERT_EQ(spres, spres_create(SP_SEV_ERROR, SP_WHAT_PPROF));
  spres = mock_wrapper(2);
  ASSERT_EQ(spres, spres_create(SP_SEV_ERROR, SP_WHAT_BADALLOC));
  spres = mock_wrapper(3);
  ASSERT_EQ(spres, spres_create(SP_SEV_ERROR, SP_WHAT_PPROF));
  spres = mock_wrapper(4);
  ASSERT_TRUE(IsSPResOK(spres));
  spres = mock_wrapper(5);
  ASSERT_EQ(spres, spres_create(SP_SEV_ERROR, SP_WHAT_PPROF));
  spres = mock_wrapper(6);
  ASSERT_EQ(spres, spres_create(SP_SEV_ERROR, SP_WHAT_STDEXCEPT));
  // a warning carried by an exception is not fatal
  spres = mock_wrapper(7);
  ASSERT_TRUE(IsSPResOK(spres));
}

TEST(SPRes, ErrorMessages) {
  EXPECT_EQ(std::string_view{spres_error_message(SP_WHAT_NO_SYMTAB)},
            "NO_SYMTAB: no symbol table in elf file");
  EXPECT_EQ(std::string_view{spres_error_message(SP_WHAT_BADALLOC)},
            "BADALLOC: allocation error");
  EXPECT_STREQ(spres_error_message(ENOENT), strerror(ENOENT));
  EXPECT_EQ(std::string_view{spres_error_message(SP_WHAT_MAX)},
            "Unknown error. Please update the error table.");
}

} // namespace stackprof
