// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "elf_symbols.hpp"

#include "logger.hpp"
#include "spres.hpp"
#include "unique_fd.hpp"

#include <cstring>
#include <fcntl.h>
#include <gelf.h>
#include <span>
#include <string_view>

using namespace std::literals;

namespace stackprof {

namespace {

constexpr std::string_view kGnuBuildIdNoteName = "GNU\0"sv;
const char *kGnuBuildIdSection = ".note.gnu.build-id";

bool elf_lib_init() {
  static const bool init_ok = elf_version(EV_CURRENT) != EV_NONE;
  return init_ok;
}

UniqueElf open_elf(const std::string &filepath, UniqueFd &fd) {
  if (!elf_lib_init()) {
    LG_WRN("Unable to initialize libelf: %s", elf_errmsg(-1));
    return UniqueElf{};
  }
  fd.reset(::open(filepath.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    LG_WRN("Unable to open %s (%s)", filepath.c_str(), strerror(errno));
    return UniqueElf{};
  }
  UniqueElf elf{elf_begin(fd.get(), ELF_C_READ_MMAP, nullptr)};
  if (!elf || elf_kind(elf.get()) != ELF_K_ELF) {
    LG_WRN("Invalid elf %s (%s)", filepath.c_str(), elf_errmsg(-1));
    return UniqueElf{};
  }
  return elf;
}

Elf_Scn *find_note_section(Elf *elf, const char *section_name) {
  size_t stridx;
  if (elf_getshdrstrndx(elf, &stridx) != 0) {
    return nullptr;
  }

  Elf_Scn *section = nullptr;
  GElf_Shdr section_header;
  while ((section = elf_nextscn(elf, section)) != nullptr) {
    if (!gelf_getshdr(section, &section_header) ||
        section_header.sh_type != SHT_NOTE) {
      continue;
    }

    const char *name = elf_strptr(elf, stridx, section_header.sh_name);
    if (name && !strcmp(name, section_name)) {
      return section;
    }
  }

  return nullptr;
}

std::span<const std::byte> process_note(Elf_Data *data, Elf64_Word note_type,
                                        std::string_view note_name) {
  size_t pos = 0;
  GElf_Nhdr note_header;
  size_t name_pos;
  size_t desc_pos;
  while ((pos = gelf_getnote(data, pos, &note_header, &name_pos, &desc_pos)) >
         0) {
    const auto *buf = reinterpret_cast<const std::byte *>(data->d_buf);
    if (note_header.n_type == note_type &&
        note_header.n_namesz == note_name.size() &&
        !memcmp(buf + name_pos, note_name.data(), note_name.size())) {
      return {buf + desc_pos, note_header.n_descsz};
    }
  }
  return {};
}

SPRes read_segments(Elf *elf, const std::string &filepath,
                    std::vector<ElfSegment> &segments) {
  size_t phnum;
  if (unlikely(elf_getphdrnum(elf, &phnum) != 0)) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_INVALID_ELF,
                           "Unable to read program headers of %s",
                           filepath.c_str());
  }
  segments.reserve(phnum);
  for (size_t i = 0; i < phnum; ++i) {
    GElf_Phdr phdr_mem;
    const GElf_Phdr *ph = gelf_getphdr(elf, static_cast<int>(i), &phdr_mem);
    if (unlikely(ph == nullptr)) {
      SPRES_RETURN_ERROR_LOG(SP_WHAT_INVALID_ELF,
                             "Unable to read program header %zu of %s", i,
                             filepath.c_str());
    }
    segments.push_back(ElfSegment{ph->p_type, ph->p_offset, ph->p_vaddr});
  }
  return {};
}

SPRes read_symtab(Elf *elf, const std::string &filepath,
                  std::vector<ElfSymbol> &symbols) {
  Elf_Scn *section = nullptr;
  GElf_Shdr shdr;
  while ((section = elf_nextscn(elf, section)) != nullptr) {
    if (gelf_getshdr(section, &shdr) && shdr.sh_type == SHT_SYMTAB) {
      break;
    }
  }
  if (!section) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_NO_SYMTAB, "No .symtab section in %s",
                           filepath.c_str());
  }

  Elf_Data *data = elf_getdata(section, nullptr);
  if (!data || shdr.sh_entsize == 0) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_INVALID_ELF,
                           "Unable to read .symtab data of %s",
                           filepath.c_str());
  }
  const size_t nb_symbols = shdr.sh_size / shdr.sh_entsize;
  // First entry is the reserved undefined symbol
  symbols.reserve(nb_symbols > 0 ? nb_symbols - 1 : 0);
  for (size_t i = 1; i < nb_symbols; ++i) {
    GElf_Sym sym;
    if (!gelf_getsym(data, static_cast<int>(i), &sym)) {
      SPRES_RETURN_ERROR_LOG(SP_WHAT_INVALID_ELF,
                             "Unable to read symbol %zu of %s", i,
                             filepath.c_str());
    }
    const char *name = elf_strptr(elf, shdr.sh_link, sym.st_name);
    symbols.push_back(ElfSymbol{name ? name : "", sym.st_value});
  }
  return {};
}

} // namespace

SPRes load_elf_symbols(const std::string &filepath, ElfSymbols &elf_symbols) {
  UniqueFd fd;
  UniqueElf elf = open_elf(filepath, fd);
  if (!elf) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_INVALID_ELF, "Unable to load %s",
                           filepath.c_str());
  }
  ElfSymbols result;
  SPRES_CHECK_FWD(read_segments(elf.get(), filepath, result.segments));
  SPRES_CHECK_FWD(read_symtab(elf.get(), filepath, result.symbols));
  LG_DBG("Loaded %zu symbols and %zu segments from %s", result.symbols.size(),
         result.segments.size(), filepath.c_str());
  elf_symbols = std::move(result);
  return {};
}

std::optional<BuildIdStr> find_build_id(const std::string &filepath) {
  UniqueFd fd;
  UniqueElf elf = open_elf(filepath, fd);
  if (!elf) {
    return std::nullopt;
  }

  Elf_Scn *note_section = find_note_section(elf.get(), kGnuBuildIdSection);
  if (note_section) {
    Elf_Data *data = elf_getdata(note_section, nullptr);
    if (data) {
      auto note = process_note(data, NT_GNU_BUILD_ID, kGnuBuildIdNoteName);
      if (!note.empty()) {
        return format_build_id(BuildIdSpan{
            reinterpret_cast<const unsigned char *>(note.data()),
            note.size()});
      }
    }
  }

  // if we didn't find the note in the sections, try the program headers
  size_t phnum;
  if (elf_getphdrnum(elf.get(), &phnum) != 0) {
    return std::nullopt;
  }
  for (size_t i = 0; i < phnum; ++i) {
    GElf_Phdr phdr_mem;
    const GElf_Phdr *phdr =
        gelf_getphdr(elf.get(), static_cast<int>(i), &phdr_mem);
    if (phdr == nullptr || phdr->p_type != PT_NOTE) {
      continue;
    }
    Elf_Data *data = elf_getdata_rawchunk(
        elf.get(), phdr->p_offset, phdr->p_filesz,
        (phdr->p_align == 8 ? ELF_T_NHDR8 : ELF_T_NHDR));
    if (data) {
      auto note = process_note(data, NT_GNU_BUILD_ID, kGnuBuildIdNoteName);
      if (!note.empty()) {
        return format_build_id(BuildIdSpan{
            reinterpret_cast<const unsigned char *>(note.data()),
            note.size()});
      }
    }
  }
  return std::nullopt;
}

} // namespace stackprof
