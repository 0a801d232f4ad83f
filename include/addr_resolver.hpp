// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "elf_symbols.hpp"
#include "spres_def.hpp"
#include "stackprof_defs.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace stackprof {

inline constexpr std::string_view k_unknown_symbol = "unknown";

// Resolves instruction addresses of one executable to function names.
// Immutable once created: resolve can be called from concurrent readers.
class AddrResolver {
public:
  AddrResolver() = default;

  // file_offset : offset in the file of the mapped LOAD segment
  // memory_start : address at which that segment is mapped in the process
  static SPRes create(ElfSymbols elf_symbols, Offset_t file_offset,
                      ProcessAddress_t memory_start, AddrResolver &resolver);

  static SPRes create_from_file(const std::string &filepath,
                                Offset_t file_offset,
                                ProcessAddress_t memory_start,
                                AddrResolver &resolver);

  // Name of the symbol at or before the address, k_unknown_symbol otherwise
  [[nodiscard]] std::string_view resolve(ProcessAddress_t addr) const;

  [[nodiscard]] bool is_pie() const { return _is_pie; }
  [[nodiscard]] Offset_t file_offset() const { return _file_offset; }
  [[nodiscard]] ProcessAddress_t memory_start() const { return _memory_start; }
  [[nodiscard]] size_t nb_symbols() const { return _symbols.size(); }

private:
  std::vector<ElfSymbol> _symbols; // sorted by value
  Offset_t _file_offset{};
  ProcessAddress_t _memory_start{};
  bool _is_pie{false};
};

} // namespace stackprof
