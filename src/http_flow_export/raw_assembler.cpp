#include "raw_assembler.hpp"

#include <cstring>

#include "logger.hpp"
#include "message_sanitizer.hpp"

namespace
{
void append(Bytes& out, const std::string& text)
{
    out.insert(out.end(), text.begin(), text.end());
}
}  // namespace

std::string RawAssembler::requestLine(const HttpRequest& request)
{
    std::string target;
    switch (request.form)
    {
        case RequestForm::Origin:
            target = request.path;
            break;
        case RequestForm::Absolute:
        case RequestForm::Authority:
            target = request.url();
            break;
    }
    return request.method + " " + target + " " + request.http_version;
}

std::string RawAssembler::statusLine(const HttpResponse& response)
{
    return response.http_version + " " + std::to_string(response.status_code) + " " +
           response.reason;
}

void RawAssembler::appendHead(Bytes& out, const std::string& start_line, const HttpHeaders& headers)
{
    append(out, start_line);
    append(out, "\r\n");
    for (const auto& field : headers)
    {
        append(out, field.name);
        append(out, ": ");
        append(out, field.value);
        append(out, "\r\n");
    }
    append(out, "\r\n");
}

Bytes RawAssembler::assembleRequest(const HttpRequest& request)
{
    Bytes out;
    appendHead(out, requestLine(request), request.headers);
    if (request.content)
    {
        out.insert(out.end(), request.content->begin(), request.content->end());
    }
    return out;
}

Bytes RawAssembler::assembleResponse(const HttpResponse& response)
{
    Bytes out;
    appendHead(out, statusLine(response), response.headers);
    if (response.content)
    {
        out.insert(out.end(), response.content->begin(), response.content->end());
    }
    return out;
}

ExportResult<Bytes> RawAssembler::assembleCombined(const HttpFlow& flow)
{
    if (!flow.request && !flow.response)
    {
        return ExportError::noContent();
    }

    Bytes out;
    if (flow.request)
    {
        auto request = MessageSanitizer::sanitizeRequest(flow);
        if (!request)
        {
            return request.error();
        }
        out = assembleRequest(request.value());
    }
    if (flow.response)
    {
        auto response = MessageSanitizer::sanitizeResponse(flow);
        if (!response)
        {
            return response.error();
        }
        if (flow.request)
        {
            out.insert(out.end(), SEPARATOR, SEPARATOR + std::strlen(SEPARATOR));
        }
        Bytes tail = assembleResponse(response.value());
        out.insert(out.end(), tail.begin(), tail.end());
    }

    LOG_DEBUG("Assembled " << out.size() << " raw bytes (request=" << flow.request.has_value()
              << " response=" << flow.response.has_value() << ")");
    return out;
}
