// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <span>
#include <string_view>

namespace stackprof {

/// Returns index to element that compares to str, otherwise -1
/// Comparison is case insensitive
int arg_which(std::string_view str, std::span<const std::string_view> str_set);

} // namespace stackprof
