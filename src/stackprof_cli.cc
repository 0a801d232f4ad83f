// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "stackprof_cli.hpp"

#include "CLI/CLI11.hpp"
#include "logger.hpp"
#include "version.hpp"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>

namespace stackprof {

namespace {
constexpr ProcessAddress_t k_default_memory_start{0x401000};
constexpr Offset_t k_default_file_offset{0x1000};

std::string get_default_config_file() {
  // The CLI docs says config files are compatible with envname, however the
  // _process_env function is called after the file function
  // Hence this hack to set the default to the actual env variable
  if (char *env_config_path = std::getenv("STACKPROF_CONFIG");
      env_config_path != nullptr) {
    return env_config_path;
  }
  return "./stackprof.toml";
}

void write_config_file(const CLI::App &app, const std::string &file_path) {
  std::ofstream out_file;
  out_file.open(file_path);
  if (!out_file) {
    // logger is not configured
    (void)fprintf(stderr, "stackprof_cli: cannot open the file %s\n",
                  file_path.c_str());
    return;
  }
  out_file << app.config_to_str();
  out_file.close();
}

// Accepts hexadecimal values with or without 0x prefix
struct HexAddressValidator : public CLI::Validator {
  HexAddressValidator() {
    name_ = "HEX_ADDRESS";
    func_ = [](const std::string &str) {
      uint64_t value;
      if (!absl::SimpleHexAtoi(str, &value)) {
        return std::string("Invalid hexadecimal address: ") + str;
      }
      return std::string();
    };
  }
};

uint64_t hex_to_u64(const std::string &str) {
  uint64_t value = 0;
  // validated by HexAddressValidator
  (void)absl::SimpleHexAtoi(str, &value);
  return value;
}

} // namespace

int StackprofCLI::parse(int argc, const char *argv[]) {
  std::string capture_config;
  CLI::App app{MYNAME " turns the stacks sampled by a BPF program into a pprof "
                      "profile.\n"
                      "The BPF program and its maps are expected to be loaded "
                      "and pinned.\n"
                      " eg: " MYNAME " --pid 1234 --wait 30 --profile cpu.pprof\n",
               MYNAME};

  // Profiling settings
  app.add_option("--pid,-p", pid, "PID of the profiled process.")
      ->group("Profiling settings")
      ->envname("STACKPROF_PID");
  app.add_option<std::chrono::seconds, unsigned>(
         "--wait,-w", wait, "Duration of the collection (in seconds).\n")
      ->default_val(
          static_cast<std::chrono::seconds>(k_default_profiling_duration)
              .count())
      ->group("Profiling settings")
      ->envname("STACKPROF_WAIT");
  app.add_option("--profile,-o", profile_path, "Output pprof file.")
      ->default_val(std::string{k_default_profile_path})
      ->group("Profiling settings")
      ->envname("STACKPROF_PROFILE");
  app.add_option("--frequency,-F", frequency,
                 "Sampling frequency of the BPF program (in Hz).\n"
                 "Used to compute the period of the profile.")
      ->default_val(k_default_sampling_frequency)
      ->check(CLI::PositiveNumber)
      ->group("Profiling settings")
      ->envname("STACKPROF_FREQUENCY");
  app.add_option("--symbolize", symbolize,
                 "Resolve the function names of the main executable.")
      ->default_val(true)
      ->group("Profiling settings")
      ->envname("STACKPROF_SYMBOLIZE");

  // Sample tables
  app.add_option("--counts_map,--counts-map", counts_map,
                 "Path of the pinned counts map.")
      ->default_val(std::string{k_default_counts_map_path})
      ->group("BPF maps")
      ->envname("STACKPROF_COUNTS_MAP");
  app.add_option("--stacks_map,--stacks-map", stacks_map,
                 "Path of the pinned stack traces map.")
      ->default_val(std::string{k_default_stacks_map_path})
      ->group("BPF maps")
      ->envname("STACKPROF_STACKS_MAP");

  // allow configuration files - default is local toml file
  app.set_config("--config", get_default_config_file(),
                 "A configuration file\n"
                 "Check the capture_config to generate the initial file")
      ->group("Advanced settings");

  // Debug
  app.add_option("--log_level,--log-level,-l", log_level,
                 "One of debug, informational, notice, warn, error.")
      ->default_val("warn")
      ->check(
          CLI::IsMember({"debug", "informational", "notice", "warn", "error"}))
      ->group("Debug options")
      ->envname("STACKPROF_LOG_LEVEL");
  app.add_option("--log_mode,--log-mode", log_mode,
                 "One of stdout, stderr, syslog, disabled or a file path.")
      ->default_val("stdout")
      ->group("Debug options")
      ->envname("STACKPROF_LOG_MODE");
  app.add_flag("--show_config,--show-config", show_config,
               "Display the configuration.")
      ->default_val(false)
      ->group("Debug options");
  app.add_flag("--show_samples,--show-samples", show_samples,
               "Display raw stacks and samples as logs.\n")
      ->group("Debug options");
  app.add_flag("--version,-v", version, "Display the profiler's version.\n")
      ->group("Debug options");
  app.add_option("--capture_config,--capture-config", capture_config,
                 "Capture the current configuration to a file.\n"
                 "You can then give this configuration through --config.\n")
      ->group("Debug options");

  // Parse
  CLI11_PARSE(app, argc, argv);

  // Dump config file
  if (!capture_config.empty()) {
    write_config_file(app, capture_config);
  }

  // Version then exit
  if (version) {
    print_version();
    return static_cast<int>(CLI::ExitCodes::Success);
  }

  // Are we setup to do something ?
  if (pid <= 0) {
    (void)fprintf(stderr, "Please specify a PID to profile \n");
    return static_cast<int>(CLI::ExitCodes::RequiredError);
  }

  continue_exec = true;
  return static_cast<int>(CLI::ExitCodes::Success);
}

void StackprofCLI::print() const {
  auto version_str = str_version();
  PRINT_NFO("Version: %.*s", static_cast<int>(version_str.size()),
            version_str.data());
  PRINT_NFO("Profiling options:");
  PRINT_NFO("  - pid: %d", pid);
  PRINT_NFO("  - wait: %lds", wait.count());
  PRINT_NFO("  - profile: %s", profile_path.c_str());
  PRINT_NFO("  - frequency: %uHz", frequency);
  PRINT_NFO("  - symbolize: %s", symbolize ? "true" : "false");
  PRINT_NFO("BPF maps:");
  PRINT_NFO("  - counts_map: %s", counts_map.c_str());
  PRINT_NFO("  - stacks_map: %s", stacks_map.c_str());
  PRINT_NFO("Debug:");
  PRINT_NFO("  - log_level: %s", log_level.c_str());
  PRINT_NFO("  - log_mode: %s", log_mode.c_str());
  PRINT_NFO("  - show_config: %s", show_config ? "true" : "false");
  if (show_samples) {
    PRINT_NFO("  - show_samples: %s", show_samples ? "true" : "false");
  }
}

int Addr2FuncCLI::parse(int argc, const char *argv[]) {
  std::string addr_str;
  std::string memory_start_str;
  std::string file_offset_str;
  CLI::App app{"addr2func resolves an address of a running executable to the "
               "name of the enclosing function.\n"
               " eg: addr2func --path ./fib --addr 0x401136\n",
               "addr2func"};

  app.add_option("--path", path, "Path of the executable.")->required();
  app.add_option("--addr", addr_str, "Address to resolve (hexadecimal).")
      ->required()
      ->check(HexAddressValidator());
  app.add_option("--memory_start,--memory-start", memory_start_str,
                 "Start address of the mapped segment (hexadecimal).")
      ->default_val(absl::StrCat("0x", absl::Hex(k_default_memory_start)))
      ->check(HexAddressValidator());
  app.add_option("--file_offset,--file-offset", file_offset_str,
                 "File offset of the mapped segment (hexadecimal).")
      ->default_val(absl::StrCat("0x", absl::Hex(k_default_file_offset)))
      ->check(HexAddressValidator());
  app.add_option("--log_level,--log-level,-l", log_level,
                 "One of debug, informational, notice, warn, error.")
      ->default_val("error")
      ->check(
          CLI::IsMember({"debug", "informational", "notice", "warn", "error"}));

  CLI11_PARSE(app, argc, argv);

  addr = hex_to_u64(addr_str);
  memory_start = hex_to_u64(memory_start_str);
  file_offset = hex_to_u64(file_offset_str);
  continue_exec = true;
  return static_cast<int>(CLI::ExitCodes::Success);
}

} // namespace stackprof
