#include "escape_utils.hpp"

#include <algorithm>

namespace
{
constexpr char HEX_DIGITS[] = "0123456789abcdef";
constexpr const char* QUOTE_ESCAPE = "'\"'\"'";

bool is_continuation(uint8_t byte)
{
    return (byte & 0xC0) == 0x80;
}
}  // namespace

size_t utf8_sequence_length(const uint8_t* data, size_t len)
{
    if (len == 0)
    {
        return 0;
    }

    uint8_t lead = data[0];
    if (lead < 0x80)
    {
        return 1;
    }

    size_t need = 0;
    uint8_t min_second = 0x80;
    uint8_t max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
        need = 2;
    }
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        need = 3;
        if (lead == 0xE0)
        {
            min_second = 0xA0;  // overlong
        }
        else if (lead == 0xED)
        {
            max_second = 0x9F;  // UTF-16 surrogates
        }
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        need = 4;
        if (lead == 0xF0)
        {
            min_second = 0x90;  // overlong
        }
        else if (lead == 0xF4)
        {
            max_second = 0x8F;  // above U+10FFFF
        }
    }
    else
    {
        return 0;
    }

    if (len < need || data[1] < min_second || data[1] > max_second)
    {
        return 0;
    }
    for (size_t i = 2; i < need; ++i)
    {
        if (!is_continuation(data[i]))
        {
            return 0;
        }
    }
    return need;
}

bool is_valid_utf8(const Bytes& bytes)
{
    size_t pos = 0;
    while (pos < bytes.size())
    {
        size_t seq = utf8_sequence_length(bytes.data() + pos, bytes.size() - pos);
        if (seq == 0)
        {
            return false;
        }
        pos += seq;
    }
    return true;
}

void append_hex_escape(std::string& out, uint8_t byte)
{
    out += "\\x";
    out += HEX_DIGITS[byte >> 4];
    out += HEX_DIGITS[byte & 0x0F];
}

std::string shell_quote_content(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        if (c == '\'')
        {
            out += QUOTE_ESCAPE;
        }
        else
        {
            out += c;
        }
    }
    return out;
}

std::string shell_single_quote(const std::string& text)
{
    return "'" + shell_quote_content(text) + "'";
}

std::string bytes_to_escaped_str(const Bytes& data)
{
    std::string out;
    out.reserve(data.size());

    size_t pos = 0;
    while (pos < data.size())
    {
        uint8_t byte = data[pos];
        if (byte >= 0x80)
        {
            size_t seq = utf8_sequence_length(data.data() + pos, data.size() - pos);
            if (seq == 0)
            {
                append_hex_escape(out, byte);
                ++pos;
            }
            else
            {
                out.append(reinterpret_cast<const char*>(data.data() + pos), seq);
                pos += seq;
            }
            continue;
        }

        switch (byte)
        {
            case '\'':
                out += QUOTE_ESCAPE;
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (byte < 0x20 || byte == 0x7F)
                {
                    append_hex_escape(out, byte);
                }
                else
                {
                    out += static_cast<char>(byte);
                }
                break;
        }
        ++pos;
    }
    return out;
}

std::string bytes_to_display_str(const Bytes& data)
{
    if (is_valid_utf8(data) && std::find(data.begin(), data.end(), '\\') == data.end())
    {
        return std::string(data.begin(), data.end());
    }

    std::string out;
    out.reserve(data.size());

    size_t pos = 0;
    while (pos < data.size())
    {
        size_t seq = utf8_sequence_length(data.data() + pos, data.size() - pos);
        if (seq == 0)
        {
            append_hex_escape(out, data[pos]);
            ++pos;
        }
        else if (data[pos] == '\\')
        {
            out += "\\\\";
            ++pos;
        }
        else
        {
            out.append(reinterpret_cast<const char*>(data.data() + pos), seq);
            pos += seq;
        }
    }
    return out;
}
