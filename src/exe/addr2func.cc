// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "addr_resolver.hpp"
#include "logger.hpp"
#include "logger_setup.hpp"
#include "spres.hpp"
#include "stackprof_cli.hpp"

#include <cstdio>
#include <cstdlib>

int main(int argc, char *argv[]) {
  using namespace stackprof;

  Addr2FuncCLI cli;
  int const res = cli.parse(argc, const_cast<const char **>(argv));
  if (!cli.continue_exec) {
    return res;
  }
  setup_logger("stderr", cli.log_level);

  AddrResolver resolver;
  if (IsSPResNotOK(AddrResolver::create_from_file(
          cli.path, cli.file_offset, cli.memory_start, resolver))) {
    (void)fprintf(stderr, "addr2func: unable to load symbols of %s\n",
                  cli.path.c_str());
    return EXIT_FAILURE;
  }

  auto name = resolver.resolve(cli.addr);
  printf("%.*s\n", static_cast<int>(name.size()), name.data());
  LOG_close();
  return EXIT_SUCCESS;
}
