// src/main.cpp
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "core/Env.hpp"
#include "core/config/Config.hpp"
#include "core/log/Logging.hpp"
#include "services/api/HttpClient.hpp"
#include "services/auth/DefaultCredentials.hpp"
#include "services/auth/TokenProvider.hpp"
#include "services/cli/CommandLine.hpp"
#include "services/pipeline/Pipeline.hpp"
#include "services/process/ProcessRunner.hpp"

// ---------- main ----------

int main(int argc, char** argv) {
  const std::string argv0 = argc > 0 ? argv[0] : "nb";

  nb::CommandLine cl;
  try {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    cl = nb::parse_command_line(args);
  } catch (const nb::UsageError& e) {
    std::cerr << argv0 << ": " << e.what() << "\n\n";
    nb::print_usage(std::cerr, argv0);
    return 1;
  }
  if (cl.help) {
    nb::print_usage(std::cout, argv0);
    return 0;
  }

  // a child closing its stdin early must not kill us
  std::signal(SIGPIPE, SIG_IGN);

  try {
    nb::init_logging(cl.verbose ? "debug" : nb::get_env_or("NB_LOG_LEVEL", "info"));

    const nb::EnvLookup env = nb::process_env;
    const nb::Config cfg = nb::load_config(cl.configFile, cl.sourceDir, env);

    // Federation signals are read once; the token provider never looks at the environment again.
    nb::HttplibClient http(std::chrono::seconds(3));
    nb::GoogleDefaultCredentials ambient(http, env);
    nb::GoogleTokenProvider tokens(nb::read_federation_context(env), http, ambient);
    nb::PosixProcessRunner processes;

    nb::PipelineOptions opts;
    opts.sourceDir = cl.sourceDir;
    opts.imageOverride = cl.image;
    opts.cluster = cl.cluster;

    nb::Pipeline pipeline(opts, cfg, processes, tokens, env, std::cout);
    pipeline.run(cl.stage);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
