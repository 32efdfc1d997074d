#include "http_message.hpp"

#include <algorithm>
#include <cctype>

uint16_t default_port(const std::string& scheme)
{
    return scheme == "https" ? 443 : 80;
}

std::string default_reason_phrase(int status_code)
{
    switch (status_code)
    {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return "";
    }
}

Bytes to_bytes(const std::string& text)
{
    return Bytes(text.begin(), text.end());
}

std::string to_string(const Bytes& bytes)
{
    return std::string(bytes.begin(), bytes.end());
}

std::string HttpRequest::authority(bool include_default_port) const
{
    std::string result;
    // IPv6 literals need brackets once a port may follow
    if (host.find(':') != std::string::npos)
    {
        result = "[" + host + "]";
    }
    else
    {
        result = host;
    }
    if (include_default_port || port != default_port(scheme))
    {
        result += ":" + std::to_string(port);
    }
    return result;
}

std::string HttpRequest::url() const
{
    if (form == RequestForm::Authority)
    {
        return authority(true);
    }
    return scheme + "://" + authority() + path;
}

bool HttpRequest::setUrl(const std::string& url)
{
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
    {
        return false;
    }

    std::string new_scheme = url.substr(0, scheme_end);
    std::transform(new_scheme.begin(), new_scheme.end(), new_scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (new_scheme != "http" && new_scheme != "https")
    {
        return false;
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos)
    {
        authority_end = url.size();
    }
    std::string authority_part = url.substr(authority_start, authority_end - authority_start);
    if (authority_part.empty() || authority_part.find('@') != std::string::npos)
    {
        return false;
    }

    std::string new_host;
    std::string port_text;
    if (authority_part[0] == '[')
    {
        size_t close = authority_part.find(']');
        if (close == std::string::npos || close == 1)
        {
            return false;
        }
        new_host = authority_part.substr(1, close - 1);
        std::string rest = authority_part.substr(close + 1);
        if (!rest.empty())
        {
            if (rest[0] != ':')
            {
                return false;
            }
            port_text = rest.substr(1);
        }
    }
    else
    {
        size_t colon = authority_part.find(':');
        new_host = authority_part.substr(0, colon);
        if (colon != std::string::npos)
        {
            port_text = authority_part.substr(colon + 1);
        }
    }
    if (new_host.empty())
    {
        return false;
    }

    uint16_t new_port = default_port(new_scheme);
    if (!port_text.empty())
    {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            return false;
        }
        int value = std::stoi(port_text);
        if (value <= 0 || value > 65535)
        {
            return false;
        }
        new_port = static_cast<uint16_t>(value);
    }

    // Fragments never go on the wire
    std::string new_path = url.substr(authority_end);
    size_t fragment = new_path.find('#');
    if (fragment != std::string::npos)
    {
        new_path.erase(fragment);
    }
    if (new_path.empty() || new_path[0] != '/')
    {
        new_path.insert(0, "/");
    }

    scheme = new_scheme;
    host = new_host;
    port = new_port;
    path = new_path;
    return true;
}
