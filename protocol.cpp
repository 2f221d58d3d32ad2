// Text protocol between runbox-server and runbox-client
// Author: Max Schwarz <max.schwarz@online.de>

#include "protocol.h"

#include <charconv>

#include <fmt/format.h>

using namespace std::literals;

namespace protocol
{

namespace
{
    constexpr auto RESULT_HEADER = "--- Execution Result ---\n"sv;
    constexpr auto RETURN_CODE = "Return Code: "sv;
    constexpr auto STDOUT_MARKER = "--- STDOUT ---\n"sv;
    constexpr auto STDERR_MARKER = "\n--- STDERR ---\n"sv;

    // Length of the UTF-8 sequence starting with @p lead, 0 if invalid
    int sequence_length(unsigned char lead)
    {
        if(lead < 0x80)
            return 1;
        if(lead >= 0xC2 && lead <= 0xDF)
            return 2;
        if(lead >= 0xE0 && lead <= 0xEF)
            return 3;
        if(lead >= 0xF0 && lead <= 0xF4)
            return 4;
        return 0;
    }
}

bool is_valid_utf8(std::string_view data)
{
    std::size_t i = 0;
    while(i < data.size())
    {
        auto lead = static_cast<unsigned char>(data[i]);
        int len = sequence_length(lead);
        if(len == 0 || i + len > data.size())
            return false;

        for(int j = 1; j < len; ++j)
        {
            if((static_cast<unsigned char>(data[i+j]) & 0xC0) != 0x80)
                return false;
        }

        // Overlong encodings, surrogates and code points above U+10FFFF
        if(len > 2)
        {
            auto second = static_cast<unsigned char>(data[i+1]);
            if(lead == 0xE0 && second < 0xA0)
                return false;
            if(lead == 0xED && second > 0x9F)
                return false;
            if(lead == 0xF0 && second < 0x90)
                return false;
            if(lead == 0xF4 && second > 0x8F)
                return false;
        }

        i += len;
    }

    return true;
}

std::string format_result(const ExecutionResult& result)
{
    return fmt::format("{}{}{}\n\n{}{}{}{}",
        RESULT_HEADER,
        RETURN_CODE, result.returnCode,
        STDOUT_MARKER, result.out,
        STDERR_MARKER, result.err
    );
}

ExecutionResult parse_response(std::string_view response)
{
    if(response.starts_with(ERROR_PREFIX) || response.starts_with(SERVER_ERROR_PREFIX))
        throw ResponseError{fmt::format("Server returned an error: {}", response)};

    auto fail = [&]() {
        return ResponseError{fmt::format("Failed to parse server response: {}", response)};
    };

    auto headerEnd = response.find("\n\n"sv);
    if(headerEnd == response.npos)
        throw fail();

    std::string_view header = response.substr(0, headerEnd);
    std::string_view rest = response.substr(headerEnd + 2);

    // Second header line carries the return code
    auto lineBreak = header.find('\n');
    if(lineBreak == header.npos)
        throw fail();

    std::string_view codeLine = header.substr(lineBreak + 1);
    if(auto next = codeLine.find('\n'); next != codeLine.npos)
        codeLine = codeLine.substr(0, next);

    if(!codeLine.starts_with(RETURN_CODE))
        throw fail();
    codeLine.remove_prefix(RETURN_CODE.size());
    while(!codeLine.empty() && (codeLine.back() == ' ' || codeLine.back() == '\r'))
        codeLine.remove_suffix(1);

    ExecutionResult result;
    auto [end, ec] = std::from_chars(codeLine.data(), codeLine.data() + codeLine.size(), result.returnCode);
    if(codeLine.empty() || ec != std::errc{} || end != codeLine.data() + codeLine.size())
        throw fail();

    if(!rest.starts_with(STDOUT_MARKER))
        throw fail();

    // With empty stdout, the newline ending the STDOUT marker starts the STDERR marker
    auto stderrPos = rest.find(STDERR_MARKER, STDOUT_MARKER.size() - 1);
    if(stderrPos == rest.npos)
        throw fail();

    if(stderrPos >= STDOUT_MARKER.size())
        result.out = rest.substr(STDOUT_MARKER.size(), stderrPos - STDOUT_MARKER.size());
    result.err = rest.substr(stderrPos + STDERR_MARKER.size());

    return result;
}

void to_json(nlohmann::json& json, const ExecutionResult& result)
{
    json = nlohmann::json{
        {"return_code", result.returnCode},
        {"stdout", result.out},
        {"stderr", result.err}
    };
}

std::string dump_json(const ExecutionResult& result)
{
    return nlohmann::json(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
