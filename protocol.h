// Text protocol between runbox-server and runbox-client
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef PROTOCOL_H
#define PROTOCOL_H

#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace protocol
{

constexpr std::string_view ERROR_PREFIX = "ERROR:";
constexpr std::string_view SERVER_ERROR_PREFIX = "SERVER ERROR:";

constexpr std::string_view ERROR_SCRIPT_TOO_LARGE = "ERROR: Script size exceeds limit.";
constexpr std::string_view ERROR_INVALID_UTF8 = "ERROR: Invalid UTF-8 data received.";
constexpr std::string_view ERROR_TIMEOUT = "ERROR: Execution timed out";
constexpr std::string_view ERROR_INTERNAL = "SERVER ERROR: An internal error occurred.";

struct ExecutionResult
{
    int returnCode = 0;
    std::string out;
    std::string err;

    bool operator==(const ExecutionResult&) const = default;
};

//! Server returned an error reply or something we cannot parse
class ResponseError : public std::runtime_error
{
public:
    explicit ResponseError(const std::string& msg)
     : std::runtime_error{msg}
    {}
};

[[nodiscard]]
bool is_valid_utf8(std::string_view data);

[[nodiscard]]
std::string format_result(const ExecutionResult& result);

/**
 * Parse a server reply.
 *
 * @throw ResponseError for error replies and malformed data
 **/
[[nodiscard]]
ExecutionResult parse_response(std::string_view response);

void to_json(nlohmann::json& json, const ExecutionResult& result);

//! Indented JSON text, invalid UTF-8 in the output is replaced by U+FFFD
[[nodiscard]]
std::string dump_json(const ExecutionResult& result);

}

#endif
