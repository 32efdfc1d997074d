#include "message_sanitizer.hpp"

#include <string>

#include "content_decoder.hpp"
#include "logger.hpp"

constexpr const char* AUTHORITY_PSEUDO_HEADER = ":authority";

bool MessageSanitizer::decodeContent(HttpHeaders& headers, std::optional<Bytes>& content)
{
    auto encoding = headers.get("content-encoding");
    if (!encoding || !content)
    {
        return false;
    }

    auto decoded = ContentDecoder::decode(*encoding, *content);
    if (!decoded)
    {
        LOG_DEBUG("Leaving body encoded as '" << *encoding << "'");
        return false;
    }

    LOG_DEBUG("Decoded '" << *encoding << "' body: " << content->size() << " -> "
              << decoded->size() << " bytes");
    content = std::move(*decoded);
    headers.remove("content-encoding");
    // Keep an existing length consistent with the decoded body, in place
    if (headers.contains("content-length"))
    {
        headers.set("content-length", std::to_string(content->size()));
    }
    return true;
}

ExportResult<HttpRequest> MessageSanitizer::sanitizeRequest(const HttpFlow& flow)
{
    if (!flow.request)
    {
        return ExportError::noRequest();
    }

    HttpRequest request = *flow.request;
    decodeContent(request.headers, request.content);

    if (request.method == "GET" && request.headers.get("content-length") == std::string("0"))
    {
        request.headers.remove("content-length");
    }
    request.headers.remove(AUTHORITY_PSEUDO_HEADER);
    return request;
}

ExportResult<HttpResponse> MessageSanitizer::sanitizeResponse(const HttpFlow& flow)
{
    if (!flow.response)
    {
        return ExportError::noResponse();
    }

    HttpResponse response = *flow.response;
    decodeContent(response.headers, response.content);
    response.headers.remove(AUTHORITY_PSEUDO_HEADER);
    return response;
}
