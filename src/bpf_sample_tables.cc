// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "bpf_sample_tables.hpp"

#include "logger.hpp"
#include "spres.hpp"

#include <bpf/bpf.h>
#include <bpf/libbpf.h>
#include <cerrno>
#include <cstring>

namespace stackprof {

namespace {

int libbpf_print_fn(enum libbpf_print_level level, const char *format,
                    va_list args) {
  int lvl = LL_DEBUG;
  switch (level) {
  case LIBBPF_WARN:
    lvl = LL_WARNING;
    break;
  case LIBBPF_INFO:
    lvl = LL_INFORMATIONAL;
    break;
  default:
    break;
  }
  if (!LOG_is_logging_enabled_for_level(lvl)) {
    return 0;
  }
  vlprintfln(lvl, "libbpf", format, args);
  return 0;
}

SPRes open_pinned_map(const std::string &pin_path, uint32_t key_size,
                      uint32_t value_size, UniqueFd &map_fd,
                      uint32_t &actual_value_size) {
  int const raw_fd = bpf_obj_get(pin_path.c_str());
  if (raw_fd < 0) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_BPF_MAP, "Unable to open pinned map %s (%s)",
                           pin_path.c_str(), strerror(errno));
  }
  UniqueFd fd{raw_fd};
  bpf_map_info info = {};
  uint32_t info_len = sizeof(info);
  if (bpf_obj_get_info_by_fd(fd.get(), &info, &info_len) != 0) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_BPF_MAP, "Unable to query map %s (%s)",
                           pin_path.c_str(), strerror(errno));
  }
  if (info.key_size != key_size || info.value_size < value_size) {
    SPRES_RETURN_ERROR_LOG(
        SP_WHAT_BPF_MAP,
        "Unexpected layout for map %s (key=%u value=%u, expected %u/%u)",
        pin_path.c_str(), info.key_size, info.value_size, key_size,
        value_size);
  }
  LG_DBG("Opened map %s (%s, %u entries)", pin_path.c_str(), info.name,
         info.max_entries);
  map_fd = std::move(fd);
  actual_value_size = info.value_size;
  return {};
}

} // namespace

void bpf_setup_logging() { libbpf_set_print(libbpf_print_fn); }

SPRes BpfCountsTable::open(const std::string &pin_path,
                           BpfCountsTable &table) {
  uint32_t value_size = 0;
  SPRES_CHECK_FWD(open_pinned_map(pin_path, sizeof(StackCountKey),
                                  sizeof(uint64_t), table._map_fd, value_size));
  if (value_size != sizeof(uint64_t)) {
    SPRES_RETURN_ERROR_LOG(SP_WHAT_BPF_MAP, "Unexpected count size %u in %s",
                           value_size, pin_path.c_str());
  }
  table._pin_path = pin_path;
  return {};
}

SPRes BpfCountsTable::iterate(const CountsVisitor &visitor) const {
  int const fd = _map_fd.get();
  return walk_counts_map(
      [fd](const StackCountKey *prev, StackCountKey *next) {
        return bpf_map_get_next_key(fd, prev, next);
      },
      [fd](const StackCountKey *key, uint64_t *count) {
        return bpf_map_lookup_elem(fd, key, count);
      },
      visitor, _pin_path.c_str());
}

SPRes BpfStackTraceTable::open(const std::string &pin_path,
                               BpfStackTraceTable &table) {
  SPRES_CHECK_FWD(open_pinned_map(pin_path, sizeof(uint32_t), k_raw_stack_size,
                                  table._map_fd, table._value_size));
  table._pin_path = pin_path;
  return {};
}

SPRes BpfStackTraceTable::lookup(int32_t stack_id,
                                 std::vector<std::byte> &bytes) const {
  bytes.resize(_value_size);
  const uint32_t key = static_cast<uint32_t>(stack_id);
  if (bpf_map_lookup_elem(_map_fd.get(), &key, bytes.data()) != 0) {
    bytes.clear();
    LG_DBG("Stack %d not found in %s (%s)", stack_id, _pin_path.c_str(),
           strerror(errno));
    return spres_warn(SP_WHAT_STACK_LOOKUP);
  }
  return {};
}

} // namespace stackprof
