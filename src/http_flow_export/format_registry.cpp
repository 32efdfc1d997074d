#include "format_registry.hpp"

#include "message_sanitizer.hpp"
#include "raw_assembler.hpp"
#include "shell_command_formatter.hpp"

ExportResult<ExportArtifact> format_curl(const HttpFlow& flow)
{
    auto request = MessageSanitizer::sanitizeRequest(flow);
    if (!request)
    {
        return request.error();
    }
    return ExportArtifact::fromText(ShellCommandFormatter::curlCommand(request.value()));
}

ExportResult<ExportArtifact> format_httpie(const HttpFlow& flow)
{
    auto request = MessageSanitizer::sanitizeRequest(flow);
    if (!request)
    {
        return request.error();
    }
    return ExportArtifact::fromText(ShellCommandFormatter::httpieCommand(request.value()));
}

ExportResult<ExportArtifact> format_raw(const HttpFlow& flow)
{
    auto bytes = RawAssembler::assembleCombined(flow);
    if (!bytes)
    {
        return bytes.error();
    }
    return ExportArtifact::fromBytes(std::move(bytes).value());
}

ExportResult<ExportArtifact> format_raw_request(const HttpFlow& flow)
{
    auto request = MessageSanitizer::sanitizeRequest(flow);
    if (!request)
    {
        return request.error();
    }
    return ExportArtifact::fromBytes(RawAssembler::assembleRequest(request.value()));
}

ExportResult<ExportArtifact> format_raw_response(const HttpFlow& flow)
{
    auto response = MessageSanitizer::sanitizeResponse(flow);
    if (!response)
    {
        return response.error();
    }
    return ExportArtifact::fromBytes(RawAssembler::assembleResponse(response.value()));
}

FormatRegistry::FormatRegistry()
    : m_formatters{
          {"curl", {"curl", ArtifactKind::Text, &format_curl, "curl command line"}},
          {"httpie", {"httpie", ArtifactKind::Text, &format_httpie, "HTTPie command line"}},
          {"raw", {"raw", ArtifactKind::Bytes, &format_raw, "request and response as HTTP/1.x"}},
          {"raw_request",
           {"raw_request", ArtifactKind::Bytes, &format_raw_request, "request as HTTP/1.x"}},
          {"raw_response",
           {"raw_response", ArtifactKind::Bytes, &format_raw_response, "response as HTTP/1.x"}},
      }
{
}

const FormatRegistry& FormatRegistry::instance()
{
    static const FormatRegistry registry;
    return registry;
}

ExportResult<Formatter> FormatRegistry::lookup(const std::string& name) const
{
    auto it = m_formatters.find(name);
    if (it == m_formatters.end())
    {
        return ExportError::unknownFormat(name);
    }
    return it->second;
}

std::vector<std::string> FormatRegistry::listFormats() const
{
    std::vector<std::string> names;
    names.reserve(m_formatters.size());
    for (const auto& [name, formatter] : m_formatters)
    {
        names.push_back(name);
    }
    return names;
}
