// Compiled-in defaults
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef CONFIG_H
#define CONFIG_H

#include <chrono>
#include <cstdint>

#include "static_path.h"

namespace config
{
    // Unprivileged identity the entrypoint hands over to
    constexpr auto USER = StaticPath("appuser");
    constexpr auto GROUP = StaticPath("appuser");

    constexpr auto HOME = StaticPath("/home") / USER;
    constexpr auto TMP = StaticPath("/tmp");
    constexpr auto UV_CACHE = HOME / ".cache/uv";

    constexpr auto PASSWD_FILE = StaticPath("/etc/passwd");
    constexpr auto GROUP_FILE = StaticPath("/etc/group");
    constexpr auto FALLBACK_SHELL = StaticPath("/bin/sh");

    // Execution server
    constexpr auto LISTEN_HOST = StaticPath("0.0.0.0");
    constexpr std::uint16_t LISTEN_PORT = 8080;
    constexpr std::chrono::seconds EXECUTION_TIMEOUT{30};
    constexpr std::size_t MAX_SCRIPT_SIZE = 60 * 1024;
    constexpr auto SCRIPT_NAME = StaticPath("main.py");
    constexpr auto WORKDIR_TEMPLATE = TMP / "runbox-XXXXXX";

    // Client
    constexpr auto CLIENT_HOST = StaticPath("localhost");
    constexpr std::chrono::seconds CLIENT_TIMEOUT{60};
}

#endif
