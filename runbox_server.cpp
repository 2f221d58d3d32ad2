// Code execution server
// Author: Max Schwarz <max.schwarz@online.de>

#include <csignal>
#include <cstdint>
#include <ranges>
#include <span>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "argparser.h"
#include "config.h"
#include "log.h"
#include "os.h"
#include "server.h"

struct Args {
  argparser::Option<bool, {.shortName = 'h'}> help = false;
  bool version = false;

  std::optional<std::string> host;
  argparser::Option<std::uint16_t, {.shortName = 'p'}> port = config::LISTEN_PORT;
  argparser::Option<unsigned int, {.shortName = 't'}> timeout =
      config::EXECUTION_TIMEOUT.count();
  argparser::Option<std::size_t> max_script_size = config::MAX_SCRIPT_SIZE;
  std::optional<std::string> runner;
  argparser::Option<bool, {.shortName = 'v'}> verbose = false;
};

void usage() {
  fmt::print(R"EOS(
Usage: runbox-server [options]

Receives a Python script per TCP connection, runs it and replies with its
exit code and output.

Options:
  --help                   This help screen.
  --version                Print version information.
  --host HOST              Listen address (default: {}).
  --port PORT              Listen port (default: {}).
  --timeout SECONDS        Execution timeout (default: {}).
  --max-script-size BYTES  Reject larger scripts (default: {}).
  --runner "CMD ARGS"      Command to run in the execution directory
                           (default: "uv run {}").
  --verbose                Enable verbose messages.

)EOS",
             config::LISTEN_HOST, config::LISTEN_PORT,
             config::EXECUTION_TIMEOUT.count(), config::MAX_SCRIPT_SIZE,
             config::SCRIPT_NAME);
}

int main(int argc, char **argv) {
  log_name = "runbox-server";

  Args args;
  try {
    argparser::parse(args, std::span<char *>(argv + 1, argc - 1));
  } catch (argparser::ArgumentException &e) {
    error("Could not parse arguments: {}", e.what());
    error("See --help for help.");
    return 2;
  }

  if (args.help) {
    usage();
    return 0;
  }

  if (args.version) {
    fmt::print("{}.{}.{}\n", RUNBOX_VERSION_MAJOR, RUNBOX_VERSION_MINOR,
               RUNBOX_VERSION_PATCH);
    return 0;
  }

  log_debug = args.verbose;

  // Clients may go away before we reply
  signal(SIGPIPE, SIG_IGN);

  server::Settings settings{
      .host = args.host ? *args.host : config::LISTEN_HOST.str(),
      .port = args.port,
      .timeout = std::chrono::seconds{static_cast<unsigned int>(args.timeout)},
      .maxScriptSize = args.max_script_size,
      .runner = {"uv", "run", config::SCRIPT_NAME.str()}};

  if (args.runner) {
    settings.runner.clear();
    for (auto part : *args.runner | std::views::split(' ')) {
      if (!std::ranges::empty(part))
        settings.runner.emplace_back(std::string_view{part});
    }

    if (settings.runner.empty())
      fatal("--runner must not be empty");
  }

  if (!os::find_binary(settings.runner[0]))
    warning("Runner {} not found in PATH, executions will fail",
            settings.runner[0]);

  debug("Runner: {}", settings.runner);

  server::Server server{settings};
  if (!server.listen())
    return 1;

  server.serve_forever();
  return 0;
}
