// Command line client for runbox-server
// Author: Max Schwarz <max.schwarz@online.de>

#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <sstream>
#include <string>

#include <fmt/format.h>

#include "argparser.h"
#include "client.h"
#include "config.h"
#include "log.h"
#include "protocol.h"

namespace {
enum ExitCode {
  EXIT_USAGE = 2,
  EXIT_CONNECTION = 3,
  EXIT_RESPONSE = 4,
};
}

struct Args {
  argparser::Option<bool, {.shortName = 'h'}> help = false;
  bool version = false;

  std::optional<std::string> host;
  argparser::Option<std::uint16_t, {.shortName = 'p'}> port = config::LISTEN_PORT;
  argparser::Option<unsigned int, {.shortName = 't'}> timeout =
      config::CLIENT_TIMEOUT.count();
  bool json = false;
  argparser::Option<bool, {.shortName = 'v'}> verbose = false;

  argparser::PositionalArguments remaining;
};

void usage() {
  fmt::print(R"EOS(
Usage: runbox-client [options] SCRIPT

Sends SCRIPT (or stdin for "-") to runbox-server and prints the result.
Exits with the script's return code.

Options:
  --help                   This help screen.
  --version                Print version information.
  --host HOST              Server host (default: {}).
  --port PORT              Server port (default: {}).
  --timeout SECONDS        Socket timeout (default: {}).
  --json                   Print the result as JSON object.
  --verbose                Enable verbose messages.

)EOS",
             config::CLIENT_HOST, config::LISTEN_PORT,
             config::CLIENT_TIMEOUT.count());
}

static std::optional<std::string> readScript(const std::string &file) {
  if (file == "-")
    return std::string{std::istreambuf_iterator<char>{std::cin}, {}};

  std::ifstream in{file, std::ios::binary};
  if (!in) {
    sys_error("Script file not found at {}", file);
    return {};
  }

  std::stringstream ss;
  ss << in.rdbuf();
  if (!in) {
    sys_error("Failed to read script file {}", file);
    return {};
  }

  return ss.str();
}

int main(int argc, char **argv) {
  log_name = "runbox-client";

  Args args;
  try {
    argparser::parse(args, std::span<char *>(argv + 1, argc - 1));
  } catch (argparser::ArgumentException &e) {
    error("Could not parse arguments: {}", e.what());
    error("See --help for help.");
    return EXIT_USAGE;
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

  if (args.remaining.size() != 1) {
    error("Need exactly one script to execute. See --help for help.");
    return EXIT_USAGE;
  }

  signal(SIGPIPE, SIG_IGN);

  auto script = readScript(args.remaining[0]);
  if (!script)
    return EXIT_USAGE;

  client::Client client{args.host ? *args.host
                                  : config::CLIENT_HOST.str(),
                        args.port,
                        std::chrono::seconds{
                            static_cast<unsigned int>(args.timeout)}};

  if (!client.connect())
    return EXIT_CONNECTION;

  auto response = client.send(*script);
  if (!response)
    return EXIT_CONNECTION;

  protocol::ExecutionResult result;
  try {
    result = protocol::parse_response(*response);
  } catch (protocol::ResponseError &e) {
    error("{}", e.what());
    return EXIT_RESPONSE;
  }

  if (args.json)
    fmt::print("{}\n", protocol::dump_json(result));
  else {
    fmt::print(stdout, "{}", result.out);
    fmt::print(stderr, "{}", result.err);
  }

  // Negative codes mean the script was killed by a signal
  if (result.returnCode < 0)
    return 128 - result.returnCode;

  return result.returnCode;
}
