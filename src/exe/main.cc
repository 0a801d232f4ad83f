// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"
#include "logger_setup.hpp"
#include "signal_helper.hpp"
#include "spres.hpp"
#include "stackprof.hpp"
#include "stackprof_cli.hpp"

#include <cstdlib>

int main(int argc, char *argv[]) {
  using namespace stackprof;

  StackprofParams params;
  {
    StackprofCLI cli;
    int const res = cli.parse(argc, const_cast<const char **>(argv));
    if (!cli.continue_exec) {
      return res;
    }

    setup_logger(cli.log_mode, cli.log_level);
    if (cli.show_config) {
      cli.print();
    }
    params = stackprof_params_from_cli(cli);
  }

  if (IsSPResNotOK(install_sigsegv_handler())) {
    LG_WRN("Running without SIGSEGV handler");
  }

  SPRes const res = stackprof_run(params);
  LOG_close();
  return IsSPResFatal(res) ? EXIT_FAILURE : EXIT_SUCCESS;
}
