// Threaded TCP code execution server
// Author: Max Schwarz <max.schwarz@online.de>

#include "server.h"

#include <atomic>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <thread>

#include <fmt/ranges.h>
#include <fmt/std.h>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <scope_guard.hpp>

#include "config.h"
#include "log.h"
#include "os.h"
#include "protocol.h"

namespace fs = std::filesystem;

namespace server
{

namespace
{
    std::string peer_name(const sockaddr_storage& addr)
    {
        char buf[INET6_ADDRSTRLEN] = {};

        if(addr.ss_family == AF_INET)
        {
            auto in = reinterpret_cast<const sockaddr_in*>(&addr);
            inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
        }
        else if(addr.ss_family == AF_INET6)
        {
            auto in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
            inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
        }
        else
            return "unknown";

        return buf;
    }

    enum class ReadStatus
    {
        Ok,
        TooLarge,
        Failed
    };

    ReadStatus read_request(int fd, std::size_t maxSize, std::string& data)
    {
        char buf[4096];
        while(true)
        {
            auto bytes = recv(fd, buf, sizeof(buf), 0);
            if(bytes < 0 && errno == EINTR)
                continue;
            if(bytes < 0)
            {
                sys_error("Could not receive data");
                return ReadStatus::Failed;
            }
            if(bytes == 0)
                return ReadStatus::Ok;

            data.append(buf, bytes);
            if(data.size() > maxSize)
                return ReadStatus::TooLarge;
        }
    }

    void reply(int fd, std::string_view data)
    {
        if(!os::write_to_fd(fd, data))
            error("Could not send reply");
    }

    void execute(int fd, const std::string& peer, const std::string& script, const Settings& settings)
    {
        std::string dirTemplate = config::WORKDIR_TEMPLATE.str();
        if(!mkdtemp(dirTemplate.data()))
        {
            sys_error("[{}] Could not create execution directory", peer);
            reply(fd, protocol::ERROR_INTERNAL);
            return;
        }

        fs::path execDir{dirTemplate};
        auto dirGuard = sg::make_scope_guard([&]{
            std::error_code ec;
            fs::remove_all(execDir, ec);
            if(ec)
                error("[{}] Could not remove {}: {}", peer, execDir, ec.message());
        });
        info("[{}] Created isolated execution directory {}", peer, execDir);

        fs::path scriptPath = execDir / config::SCRIPT_NAME.path();
        {
            std::ofstream out{scriptPath, std::ios::binary};
            out.write(script.data(), script.size());
            out.close();
            if(!out)
            {
                error("[{}] Could not write {}", peer, scriptPath);
                reply(fd, protocol::ERROR_INTERNAL);
                return;
            }
        }
        info("[{}] Saved received code to {}", peer, scriptPath);

        auto result = os::run_captured(settings.runner, execDir, settings.timeout);
        if(!result)
        {
            error("[{}] Could not run {}", peer, settings.runner);
            reply(fd, protocol::ERROR_INTERNAL);
            return;
        }

        if(result->timedOut)
        {
            error("[{}] Script timed out after {}s", peer, settings.timeout.count());
            reply(fd, protocol::ERROR_TIMEOUT);
            return;
        }

        info("[{}] Execution finished with return code {}", peer, result->exitCode);

        reply(fd, protocol::format_result({
            .returnCode = result->exitCode,
            .out = std::move(result->out),
            .err = std::move(result->err)
        }));
    }
}

void handle_connection(int fd, const std::string& peer, const Settings& settings)
{
    auto guard = sg::make_scope_guard([&]{
        close(fd);
        info("[{}] Connection closed", peer);
    });

    info("[{}] Accepted connection", peer);

    try
    {
        std::string script;
        switch(read_request(fd, settings.maxScriptSize, script))
        {
            case ReadStatus::Ok:
                break;
            case ReadStatus::TooLarge:
                error("[{}] Exceeded max script size limit of {} bytes", peer, settings.maxScriptSize);
                reply(fd, protocol::ERROR_SCRIPT_TOO_LARGE);
                shutdown(fd, SHUT_WR);
                return;
            case ReadStatus::Failed:
                return;
        }

        if(script.empty())
        {
            warning("[{}] No data received from client", peer);
            return;
        }

        if(!protocol::is_valid_utf8(script))
        {
            error("[{}] Failed to decode received data as UTF-8", peer);
            reply(fd, protocol::ERROR_INVALID_UTF8);
            return;
        }

        execute(fd, peer, script, settings);
    }
    catch(std::exception& e)
    {
        error("[{}] An unexpected error occurred in the handler: {}", peer, e.what());
        reply(fd, protocol::ERROR_INTERNAL);
    }
}

class Server::Private
{
public:
    explicit Private(const Settings& settings)
     : settings{settings}
    {}

    ~Private()
    {
        if(fd >= 0)
            close(fd);
    }

    Settings settings;
    int fd = -1;
    std::uint16_t port = 0;
    std::atomic<bool> stopping = false;
};

Server::Server(const Settings& settings)
 : m_d{std::make_unique<Private>(settings)}
{}

Server::~Server() = default;

bool Server::listen()
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* addresses = nullptr;
    auto service = std::to_string(m_d->settings.port);
    const char* host = m_d->settings.host.empty() ? nullptr : m_d->settings.host.c_str();
    if(int ret = getaddrinfo(host, service.c_str(), &hints, &addresses); ret != 0)
    {
        error("Could not resolve {}: {}", m_d->settings.host, gai_strerror(ret));
        return false;
    }
    auto guard = sg::make_scope_guard([&]{ freeaddrinfo(addresses); });

    for(auto addr = addresses; addr; addr = addr->ai_next)
    {
        int fd = socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if(fd < 0)
            continue;

        int on = 1;
        if(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0)
            sys_error("Could not set SO_REUSEADDR");

        if(bind(fd, addr->ai_addr, addr->ai_addrlen) != 0 || ::listen(fd, SOMAXCONN) != 0)
        {
            sys_error("Could not listen on {}:{}", m_d->settings.host, m_d->settings.port);
            close(fd);
            continue;
        }

        sockaddr_storage bound{};
        socklen_t len = sizeof(bound);
        if(getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0)
        {
            sys_error("Could not get socket name");
            close(fd);
            return false;
        }

        if(bound.ss_family == AF_INET)
            m_d->port = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        else
            m_d->port = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);

        m_d->fd = fd;
        return true;
    }

    error("Could not listen on any address for {}:{}", m_d->settings.host, m_d->settings.port);
    return false;
}

std::uint16_t Server::port() const
{
    return m_d->port;
}

void Server::serve_forever()
{
    info("Starting threaded server on {}:{}", m_d->settings.host, m_d->port);

    while(!m_d->stopping)
    {
        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int client = accept4(m_d->fd, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
        if(client < 0)
        {
            if(m_d->stopping)
                break;
            if(errno == EINTR || errno == ECONNABORTED)
                continue;

            sys_error("Could not accept()");
            continue;
        }

        std::thread{handle_connection, client, peer_name(addr), m_d->settings}.detach();
    }

    debug("Server loop finished");
}

void Server::stop()
{
    m_d->stopping = true;
    if(m_d->fd >= 0)
        shutdown(m_d->fd, SHUT_RDWR);
}

}
