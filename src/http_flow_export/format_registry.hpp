#ifndef FORMAT_REGISTRY_HPP
#define FORMAT_REGISTRY_HPP

#include <map>
#include <string>
#include <vector>

#include "export_artifact.hpp"
#include "export_error.hpp"
#include "http_message.hpp"

using FormatFunction = ExportResult<ExportArtifact> (*)(const HttpFlow& flow);

struct Formatter
{
    const char* name;
    ArtifactKind kind;      // kind of artifact format() always returns
    FormatFunction format;
    const char* description;
};

// Export formats. Each sanitizes the side(s) of the flow it needs.
ExportResult<ExportArtifact> format_curl(const HttpFlow& flow);
ExportResult<ExportArtifact> format_httpie(const HttpFlow& flow);
ExportResult<ExportArtifact> format_raw(const HttpFlow& flow);
ExportResult<ExportArtifact> format_raw_request(const HttpFlow& flow);
ExportResult<ExportArtifact> format_raw_response(const HttpFlow& flow);

// Closed set of export formats. Built once on first use and never modified
// afterwards, so it can be read from any thread without locking.
class FormatRegistry
{
   public:
    static const FormatRegistry& instance();

    ExportResult<Formatter> lookup(const std::string& name) const;

    // Lexicographic order
    std::vector<std::string> listFormats() const;

   private:
    FormatRegistry();

    std::map<std::string, Formatter> m_formatters;
};

#endif  // FORMAT_REGISTRY_HPP
