#ifndef HTTP_MESSAGE_HPP
#define HTTP_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "http_headers.hpp"

using Bytes = std::vector<uint8_t>;

// How the request target appears on the request line
enum class RequestForm
{
    Origin,     // GET /index.html HTTP/1.1
    Absolute,   // GET http://example.com/index.html HTTP/1.1 (proxy requests)
    Authority   // CONNECT example.com:443 HTTP/1.1
};

struct HttpRequest
{
    std::string method{"GET"};
    std::string scheme{"http"};
    std::string host;
    uint16_t port{80};
    std::string path{"/"};                   // path + query, always starts with '/'
    RequestForm form{RequestForm::Origin};
    std::string http_version{"HTTP/1.1"};
    HttpHeaders headers;
    std::optional<Bytes> content;            // decoded body as stored by the capture side

    // scheme://host[:port]path, default port omitted; host:port for authority form
    std::string url() const;

    // host[:port] as it would appear in a Host header
    std::string authority(bool include_default_port = false) const;

    // Split an absolute http/https URL into scheme, host, port and path.
    // Returns false (leaving the request untouched) on a malformed URL.
    bool setUrl(const std::string& url);
};

struct HttpResponse
{
    std::string http_version{"HTTP/1.1"};
    int status_code{200};
    std::string reason{"OK"};
    HttpHeaders headers;
    std::optional<Bytes> content;
};

// A captured exchange; either side may be missing
struct HttpFlow
{
    std::optional<HttpRequest> request;
    std::optional<HttpResponse> response;
};

uint16_t default_port(const std::string& scheme);

// Standard reason phrase for common status codes, empty for the rest
std::string default_reason_phrase(int status_code);

Bytes to_bytes(const std::string& text);
std::string to_string(const Bytes& bytes);

#endif  // HTTP_MESSAGE_HPP
