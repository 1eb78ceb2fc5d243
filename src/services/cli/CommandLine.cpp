#include "CommandLine.hpp"

namespace nb {

static std::optional<Stage> parse_stage(const std::string& s) {
  if (s == "dockerfile") return Stage::Dockerfile;
  if (s == "build")      return Stage::Build;
  if (s == "release")    return Stage::Release;
  if (s == "deploy")     return Stage::Deploy;
  return std::nullopt;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
  CommandLine cl;
  std::vector<std::string> positional;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];
    std::optional<std::string> inlineValue;
    if (arg.rfind("--", 0) == 0) {
      if (auto eq = arg.find('='); eq != std::string::npos) {
        inlineValue = arg.substr(eq + 1);
        arg.resize(eq);
      }
    }

    auto value = [&]() -> std::string {
      if (inlineValue) return *inlineValue;
      if (i + 1 >= args.size()) throw UsageError("option " + arg + " needs a value");
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      cl.help = true;
    } else if (arg == "-v" || arg == "--verbose") {
      cl.verbose = true;
    } else if (arg == "-s" || arg == "--source-directory") {
      cl.sourceDir = value();
    } else if (arg == "-c" || arg == "--config") {
      cl.configFile = value();
    } else if (arg == "-i" || arg == "--image") {
      cl.image = value();
      if (cl.image->empty()) throw UsageError("--image must not be empty");
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("unknown option " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (cl.help) return cl;
  if (positional.empty()) throw UsageError("missing command");

  auto stage = parse_stage(positional[0]);
  if (!stage) throw UsageError("unknown command " + positional[0]);
  cl.stage = *stage;

  const size_t expected = cl.stage == Stage::Deploy ? 2 : 1;
  if (cl.stage == Stage::Deploy && positional.size() < 2) throw UsageError("deploy needs a cluster name");
  if (positional.size() > expected) throw UsageError("unexpected argument " + positional[expected]);
  if (cl.stage == Stage::Deploy) cl.cluster = positional[1];
  return cl;
}

void print_usage(std::ostream& os, const std::string& argv0) {
  os << "Usage:\n"
     << "  " << argv0 << " [options] dockerfile        # print the generated Dockerfile\n"
     << "  " << argv0 << " [options] build             # build the container image\n"
     << "  " << argv0 << " [options] release           # build and push the image\n"
     << "  " << argv0 << " [options] deploy <cluster>  # build, push and deploy\n"
     << "\n"
     << "Options:\n"
     << "  -s, --source-directory DIR  root of the source tree (default .)\n"
     << "  -c, --config FILE           configuration file (default nb.json if present)\n"
     << "  -i, --image REF             use an already built image instead of building\n"
     << "  -v, --verbose               debug logging\n"
     << "  -h, --help                  show this help\n";
}

} // namespace nb
