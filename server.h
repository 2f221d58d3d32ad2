// Threaded TCP code execution server
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef SERVER_H
#define SERVER_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace server
{

struct Settings
{
    std::string host;
    std::uint16_t port = 0;
    std::chrono::seconds timeout{30};
    std::size_t maxScriptSize = 0;

    //! Command run inside the execution directory
    std::vector<std::string> runner;
};

class Server
{
public:
    explicit Server(const Settings& settings);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    [[nodiscard]]
    bool listen();

    //! Bound port (useful if listening on port 0)
    std::uint16_t port() const;

    //! Accept connections until stop() is called, one thread per client
    void serve_forever();

    void stop();

private:
    class Private;
    std::unique_ptr<Private> m_d;
};

/**
 * Serve a single connection and close it.
 *
 * Reads the script until the peer shuts down its sending side, runs it and
 * writes the reply.
 **/
void handle_connection(int fd, const std::string& peer, const Settings& settings);

}

#endif
