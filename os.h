// OS Utilities
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef OS_H
#define OS_H

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace os
{

struct RunResult
{
    //! Exit status, or minus the signal number if the child was killed
    int exitCode = 0;
    std::string out;
    std::string err;
    bool timedOut = false;
};

[[nodiscard]]
bool change_owner(const std::filesystem::path& path, uid_t uid, gid_t gid);

[[nodiscard]]
std::optional<std::filesystem::path> find_binary(const std::string_view& name);

[[nodiscard]]
bool write_to_fd(int fd, std::span<const char> data);

/**
 * Run a command in @p cwd and capture stdout and stderr.
 *
 * The child gets its own process group. When @p timeout expires, the whole
 * group is killed and RunResult::timedOut is set. Returns nothing if the
 * child could not be started.
 **/
[[nodiscard]]
std::optional<RunResult> run_captured(
    const std::vector<std::string>& cmd,
    const std::filesystem::path& cwd,
    std::chrono::milliseconds timeout);

}

#endif
