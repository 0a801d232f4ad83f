// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <cstddef>
#include <functional>

namespace stackprof {

template <class T> void hash_combine(std::size_t &seed, const T &value) {
  // NOLINTNEXTLINE(readability-magic-numbers)
  seed ^= std::hash<T>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

// Order dependent hash of all the values
template <class... Ts> std::size_t hash_values(const Ts &...values) {
  std::size_t seed = 0;
  (hash_combine(seed, values), ...);
  return seed;
}

} // namespace stackprof
