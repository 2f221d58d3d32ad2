// Privilege-dropping container entrypoint
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef ENTRYPOINT_H
#define ENTRYPOINT_H

#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "identity.h"

namespace entrypoint
{

//! Exit codes used by the entrypoint itself
enum ExitCode
{
    EXIT_SETUP_FAILED = 1,
    EXIT_USAGE = 2,
    EXIT_NOT_EXECUTABLE = 126,
    EXIT_NOT_FOUND = 127
};

/**
 * Change ownership of all @p paths to the given identity.
 *
 * Stops at the first failure; later paths are not touched.
 **/
[[nodiscard]]
bool change_ownership(std::span<const std::filesystem::path> paths, const identity::Identity& identity);

//! Join command tokens with single spaces, preserving their order
[[nodiscard]]
std::string join_command(std::span<const std::string> args);

//! Login shell of @p user, or the fallback shell if it is unusable
[[nodiscard]]
std::filesystem::path select_shell(const identity::User& user);

//! Switch identity and export the matching environment
[[nodiscard]]
bool drop_privileges(const identity::Identity& identity);

/**
 * Replace the current process with the command.
 *
 * By default, the tokens are joined and run through `<shell> -c`. With
 * @p direct, they are executed as an argument vector. Only returns if
 * exec() failed, with the exit code to report.
 **/
[[nodiscard]]
int replace_process(const identity::Identity& identity, std::span<const std::string> args, bool direct);

}

#endif
