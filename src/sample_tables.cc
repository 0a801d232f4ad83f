// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "sample_tables.hpp"

#include "logger.hpp"
#include "spres.hpp"

#include <algorithm>

namespace stackprof {

SPRes decode_stack(std::span<const std::byte> bytes, RawStack &stack) {
  if (bytes.size() < k_raw_stack_size) {
    LG_DBG("Stack value of %zu bytes, expected %zu", bytes.size(),
           k_raw_stack_size);
    return spres_warn(SP_WHAT_STACK_DECODE);
  }
  for (size_t i = 0; i < stack.size(); ++i) {
    uint64_t addr = 0;
    for (size_t b = 0; b < sizeof(uint64_t); ++b) {
      addr |= static_cast<uint64_t>(bytes[(i * sizeof(uint64_t)) + b])
          << (8 * b);
    }
    stack[i] = addr;
  }
  return {};
}

std::span<const uint64_t> traced_addresses(const RawStack &stack) {
  auto it = std::ranges::find(stack, uint64_t{0});
  return {stack.data(), static_cast<size_t>(it - stack.begin())};
}

SPRes get_stack(const StackTraceTable &table, int32_t stack_id,
                RawStack &stack) {
  if (stack_id < 0) {
    return spres_warn(SP_WHAT_NEGATIVE_STACK_ID);
  }
  std::vector<std::byte> bytes;
  SPRes res = table.lookup(stack_id, bytes);
  if (IsSPResNotOK(res)) {
    return res;
  }
  return decode_stack(bytes, stack);
}

} // namespace stackprof
