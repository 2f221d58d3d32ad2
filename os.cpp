// OS Utilities
// Author: Max Schwarz <max.schwarz@online.de>

#include "os.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <limits>
#include <ranges>
#include <thread>

#include <fmt/ranges.h>
#include <fmt/std.h>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <scope_guard.hpp>

#include "log.h"

namespace fs = std::filesystem;

namespace os
{

bool change_owner(const fs::path& path, uid_t uid, gid_t gid)
{
    debug("chown {}:{} {}", uid, gid, path);
    if(chown(path.c_str(), uid, gid) != 0)
    {
        sys_error("Could not change ownership of {} to {}:{}", path, uid, gid);
        return false;
    }

    return true;
}

std::optional<std::filesystem::path> find_binary(const std::string_view& name)
{
    if(name.find('/') != std::string_view::npos)
        return fs::path{name};

    std::string_view PATH = getenv("PATH") ? getenv("PATH") : "/bin:/usr/bin";

    for(const auto dir : std::views::split(PATH, ':'))
    {
        auto path = fs::path(std::string_view(dir)) / fs::path(name);

        std::error_code ec;
        auto stat = fs::status(path, ec);

        if(ec)
            continue;

        if(stat.type() != fs::file_type::directory && (stat.permissions() & fs::perms::owner_exec) != fs::perms::none)
            return path;
    }

    return {};
}

bool write_to_fd(int fd, std::span<const char> data)
{
    std::size_t toWrite = data.size();
    const char* ptr = data.data();

    while(toWrite != 0)
    {
        auto ret = write(fd, ptr, toWrite);
        if(ret < 0 && errno == EINTR)
            continue;
        if(ret <= 0)
        {
            sys_error("Could not write()");
            return false;
        }

        ptr += ret;
        toWrite -= ret;
    }

    return true;
}

std::optional<RunResult> run_captured(
    const std::vector<std::string>& cmd,
    const fs::path& cwd,
    std::chrono::milliseconds timeout)
{
    if(cmd.empty())
    {
        error("run_captured(): empty command");
        return {};
    }

    int outPipe[2];
    if(pipe2(outPipe, O_CLOEXEC) != 0)
    {
        sys_error("Could not create pipe");
        return {};
    }
    auto outGuard = sg::make_scope_guard([&]{ close(outPipe[0]); });

    int errPipe[2];
    if(pipe2(errPipe, O_CLOEXEC) != 0)
    {
        sys_error("Could not create pipe");
        close(outPipe[1]);
        return {};
    }
    auto errGuard = sg::make_scope_guard([&]{ close(errPipe[0]); });

    // We might be one of many threads, so no allocations after fork()
    std::vector<char*> argv;
    for(auto& arg : cmd)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    debug("Running {} in {}", cmd, cwd);

    auto pid = fork();
    if(pid == 0)
    {
        setpgid(0, 0);

        if(dup2(outPipe[1], STDOUT_FILENO) == -1 || dup2(errPipe[1], STDERR_FILENO) == -1)
            _exit(127);

        if(chdir(cwd.c_str()) != 0)
        {
            constexpr char msg[] = "runbox: could not change into working directory\n";
            [[maybe_unused]] auto ret = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(127);
        }

        execvp(argv[0], argv.data());

        constexpr char msg[] = "runbox: could not execute command\n";
        [[maybe_unused]] auto ret = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    close(outPipe[1]);
    close(errPipe[1]);

    if(pid < 0)
    {
        sys_error("Could not fork()");
        return {};
    }

    RunResult result;

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::array<pollfd, 2> fds{{
        {.fd = outPipe[0], .events = POLLIN, .revents = 0},
        {.fd = errPipe[0], .events = POLLIN, .revents = 0}
    }};
    std::array<std::string*, 2> sinks{&result.out, &result.err};

    char buf[4096];
    while(fds[0].fd >= 0 || fds[1].fd >= 0)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        );
        if(remaining.count() <= 0)
        {
            result.timedOut = true;
            break;
        }

        auto pollTimeout = std::min<std::chrono::milliseconds::rep>(
            remaining.count(), std::numeric_limits<int>::max()
        );
        int ret = poll(fds.data(), fds.size(), static_cast<int>(pollTimeout));
        if(ret < 0)
        {
            if(errno == EINTR)
                continue;

            sys_error("Could not poll()");
            kill(-pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return {};
        }
        if(ret == 0)
            continue;

        for(std::size_t i = 0; i < fds.size(); ++i)
        {
            if(fds[i].fd < 0 || fds[i].revents == 0)
                continue;

            auto bytes = read(fds[i].fd, buf, sizeof(buf));
            if(bytes < 0 && errno == EINTR)
                continue;
            if(bytes <= 0)
            {
                // EOF, the fd itself is closed by the guards
                fds[i].fd = -1;
                continue;
            }

            sinks[i]->append(buf, bytes);
        }
    }

    int wstatus = 0;

    // The child may have closed its output and still be running
    while(!result.timedOut)
    {
        auto ret = waitpid(pid, &wstatus, WNOHANG);
        if(ret == pid)
            break;
        if(ret < 0 && errno != EINTR)
        {
            sys_error("Could not wait for cmd {}", cmd[0]);
            kill(-pid, SIGKILL);
            return {};
        }

        if(std::chrono::steady_clock::now() >= deadline)
            result.timedOut = true;
        else
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }

    if(result.timedOut)
    {
        debug("Timeout, killing process group {}", pid);
        kill(-pid, SIGKILL);

        while(waitpid(pid, &wstatus, 0) < 0)
        {
            if(errno != EINTR)
            {
                sys_error("Could not wait for cmd {}", cmd[0]);
                return {};
            }
        }
    }

    if(WIFEXITED(wstatus))
        result.exitCode = WEXITSTATUS(wstatus);
    else if(WIFSIGNALED(wstatus))
        result.exitCode = -WTERMSIG(wstatus);

    return result;
}

}
