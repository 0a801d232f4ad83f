// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "spres_def.hpp"
#include "stackprof_defs.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace stackprof {

// Layout of the key of the kernel side counts table
struct StackCountKey {
  uint32_t pid;
  int32_t user_stack_id;   // negative when the capture failed
  int32_t kernel_stack_id; // negative when the capture failed
};
static_assert(sizeof(StackCountKey) == 12,
              "StackCountKey must match the kernel side key layout");

// Addresses of a sampled stack, most recent first. Unused slots are zero.
using RawStack = std::array<uint64_t, k_max_stack_depth>;
inline constexpr size_t k_raw_stack_size = sizeof(RawStack);

using CountsVisitor =
    std::function<void(const StackCountKey &key, uint64_t count)>;

// Table of occurrence counts keyed by (pid, user stack, kernel stack)
class CountsTable {
public:
  virtual ~CountsTable() = default;
  // Calls visitor on every entry. An error can occur after some entries
  // were visited.
  virtual SPRes iterate(const CountsVisitor &visitor) const = 0;
};

// Table of raw stacks keyed by stack id
class StackTraceTable {
public:
  virtual ~StackTraceTable() = default;
  // Returns a SP_WHAT_STACK_LOOKUP warning when the id is not present
  virtual SPRes lookup(int32_t stack_id, std::vector<std::byte> &bytes) const = 0;
};

// Reads k_max_stack_depth little endian addresses
SPRes decode_stack(std::span<const std::byte> bytes, RawStack &stack);

// Addresses before the first zero
std::span<const uint64_t> traced_addresses(const RawStack &stack);

// Lookup and decode
SPRes get_stack(const StackTraceTable &table, int32_t stack_id,
                RawStack &stack);

} // namespace stackprof
