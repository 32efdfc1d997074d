#include "shell_command_formatter.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "escape_utils.hpp"

constexpr const char* SHELL_SAFE_PUNCTUATION = "-_./:@%+=,";

std::string ShellCommandFormatter::headerArgument(const HttpHeader& field)
{
    return shell_single_quote(field.name + ":" + field.value);
}

std::string ShellCommandFormatter::shellWord(const std::string& text)
{
    bool safe = !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || (c != 0 && std::strchr(SHELL_SAFE_PUNCTUATION, c) != nullptr);
    });
    return safe ? text : shell_single_quote(text);
}

std::string ShellCommandFormatter::curlCommand(const HttpRequest& request)
{
    std::string data = "curl ";

    bool compressed = std::any_of(request.headers.begin(), request.headers.end(),
                                  [](const HttpHeader& field) {
                                      return header_name_equals(field.name, "accept-encoding");
                                  });
    if (compressed)
    {
        data += "--compressed ";
    }

    for (const auto& field : request.headers)
    {
        data += "-H " + headerArgument(field) + " ";
    }

    if (request.method != "GET")
    {
        data += "-X " + request.method + " ";
    }

    data += shell_single_quote(request.url());

    if (request.content && !request.content->empty())
    {
        data += " --data-binary '" + bytes_to_escaped_str(*request.content) + "'";
    }
    return data;
}

std::string ShellCommandFormatter::httpieCommand(const HttpRequest& request)
{
    std::string data = "http " + request.method + " " + shellWord(request.url());

    for (const auto& field : request.headers)
    {
        data += " " + headerArgument(field);
    }

    if (request.content && !request.content->empty())
    {
        data += " <<< '" + bytes_to_escaped_str(*request.content) + "'";
    }
    return data;
}
