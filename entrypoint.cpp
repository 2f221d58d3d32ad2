// Privilege-dropping container entrypoint
// Author: Max Schwarz <max.schwarz@online.de>

#include "entrypoint.h"

#include <cerrno>
#include <ranges>

#include <fmt/ranges.h>
#include <fmt/std.h>

#include <unistd.h>

#include "config.h"
#include "log.h"
#include "os.h"

namespace fs = std::filesystem;

namespace entrypoint
{

bool change_ownership(std::span<const fs::path> paths, const identity::Identity& identity)
{
    for(auto& path : paths)
    {
        if(!os::change_owner(path, identity.user.uid, identity.group.gid))
            return false;
    }

    return true;
}

std::string join_command(std::span<const std::string> args)
{
    return fmt::format("{}", fmt::join(args, " "));
}

fs::path select_shell(const identity::User& user)
{
    if(!user.shell.empty() && access(user.shell.c_str(), X_OK) == 0)
        return user.shell;

    if(!user.shell.empty())
        warning("Login shell {} of {} is not usable, falling back to {}", user.shell, user.name, config::FALLBACK_SHELL);

    return config::FALLBACK_SHELL.path();
}

bool drop_privileges(const identity::Identity& identity)
{
    if(!identity::switch_to(identity))
        return false;

    identity::export_environment(identity);
    return true;
}

int replace_process(const identity::Identity& identity, std::span<const std::string> args, bool direct)
{
    auto shell = select_shell(identity.user);

    std::vector<std::string> cmd;
    if(direct && !args.empty())
        cmd.assign(args.begin(), args.end());
    else if(direct)
        cmd = {shell.string()};
    else
        cmd = {shell.string(), "-c", join_command(args)};

    std::vector<char*> argv;
    for(auto& arg : cmd)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    debug("Executing {}", cmd);

    // stdio buffers are lost on exec()
    std::fflush(stdout);
    std::fflush(stderr);

    if(direct)
        execvp(argv[0], argv.data());
    else
        execv(shell.c_str(), argv.data());

    int err = errno;
    sys_error("Could not execute {}", cmd);

    return err == ENOENT ? EXIT_NOT_FOUND : EXIT_NOT_EXECUTABLE;
}

}
