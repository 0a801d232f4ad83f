// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "addr_resolver.hpp"

#include "logger.hpp"
#include "spres.hpp"

#include <algorithm>
#include <elf.h>
#include <functional>
#include <iterator>

namespace stackprof {

SPRes AddrResolver::create(ElfSymbols elf_symbols, Offset_t file_offset,
                           ProcessAddress_t memory_start,
                           AddrResolver &resolver) {
  auto it = std::ranges::find_if(
      elf_symbols.segments, [file_offset](const ElfSegment &segment) {
        return segment.type == PT_LOAD && segment.offset == file_offset;
      });
  if (it == elf_symbols.segments.end()) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_NO_MATCHING_LOAD_SEGMENT,
                           "No LOAD segment at file offset 0x%lx",
                           file_offset);
  }

  AddrResolver result;
  result._is_pie = (it->vaddr == it->offset);
  result._file_offset = file_offset;
  result._memory_start = memory_start;
  result._symbols = std::move(elf_symbols.symbols);
  std::ranges::stable_sort(result._symbols, std::less{}, &ElfSymbol::value);

  LG_DBG("Resolver: %zu symbols, offset=0x%lx, start=0x%lx, pie=%s",
         result._symbols.size(), file_offset, memory_start,
         result._is_pie ? "true" : "false");
  resolver = std::move(result);
  return {};
}

SPRes AddrResolver::create_from_file(const std::string &filepath,
                                     Offset_t file_offset,
                                     ProcessAddress_t memory_start,
                                     AddrResolver &resolver) {
  try {
    ElfSymbols elf_symbols;
    SPRES_CHECK_FWD(load_elf_symbols(filepath, elf_symbols));
    SPRES_CHECK_FWD(
        create(std::move(elf_symbols), file_offset, memory_start, resolver));
  }
  CatchExcept2SPRes();
  return {};
}

std::string_view AddrResolver::resolve(ProcessAddress_t addr) const {
  if (addr == 0) {
    return k_unknown_symbol;
  }
  ElfAddress_t elf_addr = addr;
  if (_is_pie) {
    if (addr < _memory_start) {
      return k_unknown_symbol;
    }
    elf_addr = _file_offset + (addr - _memory_start);
  }

  auto it = std::ranges::lower_bound(_symbols, elf_addr, std::less{},
                                     &ElfSymbol::value);
  if (it == _symbols.end()) {
    return k_unknown_symbol;
  }
  if (it->value == elf_addr) {
    return it->name;
  }
  if (it != _symbols.begin() && std::prev(it)->value > 0) {
    return std::prev(it)->name;
  }
  return k_unknown_symbol;
}

} // namespace stackprof
