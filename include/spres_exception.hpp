// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "spres_def.hpp"
#include "spres_helpers.hpp"
#include "spres_list.hpp"

#include <exception>
#include <new>

namespace stackprof {

/// Standard exception containing a SPRes
class SPException : public std::exception {
public:
  explicit SPException(SPRes spres) : _spres(spres) {}
  [[nodiscard]] SPRes get_SPRes() const { return _spres; }
  [[nodiscard]] const char *what() const noexcept override {
    return spres_error_message(_spres._what);
  }

private:
  SPRes _spres;
};
} // namespace stackprof

/// Closes a try block: exceptions become fatal results
#define CatchExcept2SPRes()                                                    \
  catch (const stackprof::SPException &e) {                                    \
    SPRES_CHECK_FWD(e.get_SPRes());                                            \
  }                                                                            \
  catch (const std::bad_alloc &ba) {                                           \
    LOG_ERROR_DETAILS(LG_ERR, stackprof::SP_WHAT_BADALLOC);                    \
    return stackprof::spres_error(stackprof::SP_WHAT_BADALLOC);                \
  }                                                                            \
  catch (const std::exception &e) {                                            \
    LG_ERR("Exception caught: %s", e.what());                                  \
    LOG_ERROR_DETAILS(LG_ERR, stackprof::SP_WHAT_STDEXCEPT);                   \
    return stackprof::spres_error(stackprof::SP_WHAT_STDEXCEPT);               \
  }                                                                            \
  catch (...) {                                                                \
    LOG_ERROR_DETAILS(LG_ERR, stackprof::SP_WHAT_UKNWEXCEPT);                  \
    return stackprof::spres_error(stackprof::SP_WHAT_UKNWEXCEPT);              \
  }
