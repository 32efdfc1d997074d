#ifndef ESCAPE_UTILS_HPP
#define ESCAPE_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "http_message.hpp"

// Length of the well-formed UTF-8 sequence starting at data[0] (1-4), or 0
// when the bytes there are not valid UTF-8 (overlongs and surrogates included)
size_t utf8_sequence_length(const uint8_t* data, size_t len);

bool is_valid_utf8(const Bytes& bytes);

// Appends \xNN (lowercase hex)
void append_hex_escape(std::string& out, uint8_t byte);

// Text for the inside of a single-quoted POSIX shell literal: every ' is
// written as '"'"' (close, double-quoted quote, reopen)
std::string shell_quote_content(const std::string& text);

// Wraps text in single quotes using shell_quote_content
std::string shell_single_quote(const std::string& text);

// Body text for the inside of a single-quoted shell literal. Printable ASCII
// and valid UTF-8 pass through, ' is neutralised as above, \n \r \t become
// two-character escapes and every other byte becomes \xNN.
std::string bytes_to_escaped_str(const Bytes& data);

// Clipboard rendering. Valid UTF-8 without backslashes is returned as is.
// Otherwise a backslash becomes \\, a byte outside a valid UTF-8 sequence
// becomes \xNN and everything else (control characters included) is kept.
// Escaped output always contains a backslash; unescaped output never does.
std::string bytes_to_display_str(const Bytes& data);

#endif  // ESCAPE_UTILS_HPP
