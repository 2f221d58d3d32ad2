// Client for runbox-server
// Author: Max Schwarz <max.schwarz@online.de>

#include "client.h"

#include <cerrno>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <scope_guard.hpp>

#include "log.h"
#include "os.h"

namespace client
{

Client::Client(std::string host, std::uint16_t port, std::chrono::seconds timeout)
 : m_host{std::move(host)}
 , m_port{port}
 , m_timeout{timeout}
{}

Client::~Client()
{
    close();
}

bool Client::connect()
{
    if(m_fd >= 0)
    {
        warning("Already connected, ignoring connect()");
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    auto service = std::to_string(m_port);
    if(int ret = getaddrinfo(m_host.c_str(), service.c_str(), &hints, &addresses); ret != 0)
    {
        error("Could not resolve {}: {}", m_host, gai_strerror(ret));
        return false;
    }
    auto guard = sg::make_scope_guard([&]{ freeaddrinfo(addresses); });

    timeval tv{};
    tv.tv_sec = m_timeout.count();

    debug("Connecting to {}:{}", m_host, m_port);
    for(auto addr = addresses; addr; addr = addr->ai_next)
    {
        int fd = socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if(fd < 0)
            continue;

        // Also limits connect() on Linux
        if(setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0
            || setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        {
            sys_error("Could not set socket timeout");
        }

        if(::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0)
        {
            m_fd = fd;
            debug("Connection established");
            return true;
        }

        ::close(fd);
    }

    sys_error("Failed to connect to {}:{}", m_host, m_port);
    return false;
}

void Client::close()
{
    if(m_fd < 0)
        return;

    debug("Closing connection");
    if(::close(m_fd) != 0)
        sys_error("Error while closing socket");

    m_fd = -1;
}

std::optional<std::string> Client::send(std::string_view script)
{
    if(m_fd < 0)
    {
        error("Client is not connected");
        return {};
    }

    debug("Sending script ({} bytes)", script.size());
    if(!os::write_to_fd(m_fd, script))
        return {};

    if(shutdown(m_fd, SHUT_WR) != 0)
    {
        sys_error("Could not shut down sending side");
        return {};
    }

    std::string response;
    char buf[4096];
    while(true)
    {
        auto bytes = recv(m_fd, buf, sizeof(buf), 0);
        if(bytes < 0 && errno == EINTR)
            continue;
        if(bytes < 0)
        {
            if(errno == EAGAIN || errno == EWOULDBLOCK)
                error("Timed out while waiting for server response");
            else
                sys_error("Could not receive server response");
            return {};
        }
        if(bytes == 0)
            break;

        response.append(buf, bytes);
    }

    debug("Received full response ({} bytes)", response.size());
    return response;
}

}
