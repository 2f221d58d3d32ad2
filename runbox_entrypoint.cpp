// Container entrypoint: fix ownership, drop privileges, exec command
// Author: Max Schwarz <max.schwarz@online.de>

#include <cstdlib>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include <wordexp.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <scope_guard.hpp>

#include "argparser.h"
#include "config.h"
#include "entrypoint.h"
#include "identity.h"
#include "log.h"

namespace fs = std::filesystem;

struct Args {
  argparser::Option<bool, {.shortName = 'h'}> help = false;
  bool version = false;

  std::optional<std::string> user;
  std::vector<std::string> chown;
  bool direct = false;
  argparser::Option<bool, {.shortName = 'v'}> verbose = false;

  argparser::PositionalArguments remaining;
};

void usage() {
  fmt::print(R"EOS(
Usage: runbox-entrypoint [options] [--] [cmd...]

Changes ownership of the runtime directories, switches to the unprivileged
user and replaces itself with cmd. cmd is joined with spaces and run through
the user's login shell.

Options:
  --help                   This help screen.
  --version                Print version information.
  --user USER[:GROUP]      Run as USER (default: {}:{}).
  --chown PATH             Change ownership of PATH. Can be given multiple
                           times and replaces the defaults ({}, {}).
  --direct                 Execute cmd as argument vector without a shell.
  --verbose                Enable verbose messages.

Additional options are read from the RUNBOX_ARGS environment variable.

)EOS",
             config::USER, config::GROUP, config::TMP, config::UV_CACHE);
}

int main(int argc, char **argv) {
  log_name = "runbox-entrypoint";

  Args args;
  try {
    argparser::Parser parser{args};

    if (auto env = getenv("RUNBOX_ARGS")) {
      wordexp_t words{};
      auto guard = sg::make_scope_guard([&] { wordfree(&words); });

      if (auto ret = wordexp(env, &words, WRDE_SHOWERR | WRDE_NOCMD)) {
        switch (ret) {
        case WRDE_BADCHAR:
          error("Invalid character in RUNBOX_ARGS");
          break;
        case WRDE_BADVAL:
          error("Undefined env variable in RUNBOX_ARGS");
          break;
        case WRDE_CMDSUB:
          error("Command substitution is not allowed in RUNBOX_ARGS");
          break;
        case WRDE_NOSPACE:
          fatal("Out of memory");
        case WRDE_SYNTAX:
          error("Syntax error in RUNBOX_ARGS");
          break;
        default:
          error("Unknown wordexp() error");
          break;
        }
        return entrypoint::EXIT_USAGE;
      }

      parser.parse(std::span<char *>(words.we_wordv, words.we_wordc));
    }

    parser.parse(std::span<char *>(argv + 1, argc - 1));
  } catch (argparser::ArgumentException &e) {
    error("Could not parse arguments: {}", e.what());
    error("See --help for help.");
    return entrypoint::EXIT_USAGE;
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

  std::string userSpec =
      args.user ? *args.user
                : fmt::format("{}:{}", config::USER, config::GROUP);

  std::vector<fs::path> paths;
  if (args.chown.empty())
    paths = {config::TMP.path(), config::UV_CACHE.path()};
  else
    paths.assign(args.chown.begin(), args.chown.end());

  auto target = identity::resolve(userSpec);
  if (!target)
    return entrypoint::EXIT_SETUP_FAILED;

  info("Running as {}", identity::current_user_name());

  if (!identity::has_capability(CAP_CHOWN))
    warning("Missing CAP_CHOWN, changing ownership will probably fail");

  info("Changing ownership of {} to {}:{}...", paths, target->user.name,
       target->group.name);
  if (!entrypoint::change_ownership(paths, *target)) {
    error("Not starting {}", args.remaining);
    return entrypoint::EXIT_SETUP_FAILED;
  }

  info("Dropping privileges to {} and executing {}", target->user.name,
       args.remaining);
  if (!entrypoint::drop_privileges(*target))
    return entrypoint::EXIT_SETUP_FAILED;

  return entrypoint::replace_process(*target, args.remaining, args.direct);
}
