// Client for runbox-server
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef CLIENT_H
#define CLIENT_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace client
{

class Client
{
public:
    Client(std::string host, std::uint16_t port, std::chrono::seconds timeout);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]]
    bool connect();

    void close();

    bool isConnected() const
    { return m_fd >= 0; }

    /**
     * Send a script and wait for the complete reply.
     *
     * Shuts down our sending side so the server knows the script is
     * complete. The connection is unusable afterwards.
     **/
    [[nodiscard]]
    std::optional<std::string> send(std::string_view script);

private:
    std::string m_host;
    std::uint16_t m_port;
    std::chrono::seconds m_timeout;
    int m_fd = -1;
};

}

#endif
