// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "spres_list.hpp"

#include <cstring>
#include <iterator>

namespace stackprof {

namespace {
const char *const s_common_error_messages[] = {
    COMMON_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

const char *const s_native_error_messages[] = {
    NATIVE_ERROR_TABLE(EXPAND_ERROR_MESSAGE)};

static_assert(std::size(s_common_error_messages) ==
              COMMON_ERROR_SIZE - SP_WHAT_MIN_ERRNO - 1);
static_assert(std::size(s_native_error_messages) ==
              NATIVE_ERROR_SIZE - SP_WHAT_MIN_NATIVE - 1);
} // namespace

const char *spres_error_message(int16_t what) {
  if (what > SP_WHAT_MIN_ERRNO && what < COMMON_ERROR_SIZE) {
    return s_common_error_messages[what - SP_WHAT_MIN_ERRNO - 1];
  }
  if (what > SP_WHAT_MIN_NATIVE && what < NATIVE_ERROR_SIZE) {
    return s_native_error_messages[what - SP_WHAT_MIN_NATIVE - 1];
  }
  if (what >= 0 && what < SP_WHAT_MIN_ERRNO) {
    // errno values are forwarded as is
    return strerror(what);
  }
  return "Unknown error. Please update the error table.";
}

} // namespace stackprof
