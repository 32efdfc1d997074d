#ifndef SHELL_COMMAND_FORMATTER_HPP
#define SHELL_COMMAND_FORMATTER_HPP

#include <string>

#include "http_message.hpp"

// Renders a sanitized request as a command line that replays it.
//
//   curl [--compressed] -H 'name:value' ... [-X METHOD] 'url' [--data-binary '...']
//   http METHOD url 'name:value' ... [<<< '...']
//
// Every single-quoted literal is safe to paste into a POSIX shell: quotes are
// written as '"'"' and bodies go through bytes_to_escaped_str().
class ShellCommandFormatter
{
   public:
    static std::string curlCommand(const HttpRequest& request);
    static std::string httpieCommand(const HttpRequest& request);

   private:
    static std::string headerArgument(const HttpHeader& field);
    // Quoted only when the shell would otherwise interpret part of it
    static std::string shellWord(const std::string& text);
};

#endif  // SHELL_COMMAND_FORMATTER_HPP
