// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger_setup.hpp"

#include "logger.hpp"
#include "stackprof_cmdline.hpp"

#include <string>

namespace stackprof {

void setup_logger(std::string_view log_mode, std::string_view log_level) {
  // Process logging mode
  static constexpr std::string_view logpattern[] = {"stdout", "stderr",
                                                    "syslog", "disabled"};
  int const idx_log_mode =
      log_mode.empty() ? 0 : arg_which(log_mode, logpattern); // stdout
  switch (idx_log_mode) {
  case 0:
    LOG_open(LOG_STDOUT, "");
    break;
  case 1:
    LOG_open(LOG_STDERR, "");
    break;
  case 2:
    LOG_open(LOG_SYSLOG, "");
    break;
  case 3:
    LOG_open(LOG_DISABLE, "");
    break;
  default: {
    const std::string log_file{log_mode};
    if (!LOG_open(LOG_FILE, log_file.c_str())) {
      // fallback so that errors are still visible
      LOG_open(LOG_STDERR, "");
      LG_ERR("Unable to open log file %s", log_file.c_str());
    }
    break;
  }
  }

  // Process logging level
  static constexpr std::string_view loglpattern[] = {
      "debug", "informational", "notice", "warn", "error"};
  switch (arg_which(log_level, loglpattern)) {
  case 0:
    LOG_setlevel(LL_DEBUG);
    break;
  case 1:
    LOG_setlevel(LL_INFORMATIONAL);
    break;
  case 2:
    LOG_setlevel(LL_NOTICE);
    break;
  case 4:
    LOG_setlevel(LL_ERROR);
    break;
  case -1: // default
  case 3:
  default:
    LOG_setlevel(LL_WARNING);
    break;
  }
}

} // namespace stackprof
