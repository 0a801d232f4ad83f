// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace stackprof {

// Maximum depth of a sampled stack, matches MAX_STACK_DEPTH of the BPF program
inline constexpr size_t k_max_stack_depth{127};

// Default sampling frequency of the kernel side sampler (Hz)
inline constexpr uint32_t k_default_sampling_frequency{100};

inline constexpr std::chrono::seconds k_default_profiling_duration{10};

// Elf address (same as the address used with addr2line)
using ElfAddress_t = uint64_t;
// Offset types : add or subtract to address types
using Offset_t = ElfAddress_t;
// Absolute address (needs to be adjusted with the start address of binary)
using ProcessAddress_t = ElfAddress_t;

using MappingIdx_t = int32_t;
inline constexpr MappingIdx_t k_mapping_idx_null = -1;

using LocationIdx_t = int32_t;

// Linux Inode type
using inode_t = uint64_t;

} // namespace stackprof
