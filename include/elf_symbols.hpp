// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "build_id.hpp"
#include "spres_def.hpp"
#include "stackprof_defs.hpp"

#include <libelf.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stackprof {

inline constexpr auto elf_deleter = [](Elf *elf) { elf_end(elf); };
using UniqueElf = std::unique_ptr<Elf, decltype(elf_deleter)>;

struct ElfSymbol {
  std::string name;
  ElfAddress_t value;
};

// Program header of an ELF file (only the fields used for address placement)
struct ElfSegment {
  uint32_t type;
  Offset_t offset;
  ElfAddress_t vaddr;
};

struct ElfSymbols {
  std::vector<ElfSymbol> symbols; // .symtab entries, file order
  std::vector<ElfSegment> segments;
};

// Reads the static symbol table and program headers of an ELF file
SPRes load_elf_symbols(const std::string &filepath, ElfSymbols &elf_symbols);

// GNU build id of the ELF file if readable
std::optional<BuildIdStr> find_build_id(const std::string &filepath);

} // namespace stackprof
