// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "stackprof_base.hpp"

#include <cstdint>

namespace stackprof {

// although we keep it in a int16, we only need a uint8 for the enum
enum SP_RES_SEV : uint8_t {
  SP_SEV_OK = 0,
  SP_SEV_NOTICE = 1,
  SP_SEV_WARN = 2,
  SP_SEV_ERROR = 3,
};

/// Result structure containing a what / severity
struct SPRes {
  union {
    struct {
      int16_t _what; // Type of result (see spres_list.hpp)
      int16_t _sev;  // fatal, warn, OK...
    };
    int32_t _val;
  };
};

/// sev, what
inline SPRes spres_create(int16_t sev, int16_t what) {
  SPRes spres;
  spres._sev = sev;
  spres._what = what;
  return spres;
}

/// Creates a SPRes taking an error code (what)
inline SPRes spres_error(int16_t what) {
  return spres_create(SP_SEV_ERROR, what);
}

/// Creates a SPRes with a warning taking an error code (what)
inline SPRes spres_warn(int16_t what) { return spres_create(SP_SEV_WARN, what); }

/// Create an OK SPRes
inline SPRes spres_init() {
  SPRes spres = {};
  return spres;
}

/// returns a bool : true if they are equal
inline bool spres_equal(SPRes lhs, SPRes rhs) { return lhs._val == rhs._val; }

inline bool operator==(SPRes lhs, SPRes rhs) { return spres_equal(lhs, rhs); }

} // namespace stackprof

// Assumption behind these is that SP_SEV_ERROR does not occur often

/// true if spres is not OK (unlikely)
#define IsSPResNotOK(res) unlikely((res)._sev != stackprof::SP_SEV_OK)

/// true if spres is OK (likely)
#define IsSPResOK(res) likely((res)._sev == stackprof::SP_SEV_OK)

/// true if spres is fatal (unlikely)
#define IsSPResFatal(res) unlikely((res)._sev == stackprof::SP_SEV_ERROR)
