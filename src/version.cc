// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "version.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/substitute.h>
#include <string>

namespace stackprof {

namespace {
// major.minor.patch[+revision]
std::string build_version_string() {
  std::string version =
      absl::Substitute("$0.$1.$2", VER_MAJ, VER_MIN, VER_PATCH);
  if (*VER_REV) {
    absl::StrAppend(&version, "+", VER_REV);
  }
  return version;
}
} // namespace

std::string_view str_version() {
  static const std::string version_str = build_version_string();
  return version_str;
}

void print_version() { absl::PrintF("%s %s\n", MYNAME, str_version()); }

} // namespace stackprof
