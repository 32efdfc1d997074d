#ifndef EXPORT_SERVICE_HPP
#define EXPORT_SERVICE_HPP

#include <optional>
#include <string>
#include <vector>

#include "export_error.hpp"
#include "export_sink.hpp"
#include "format_registry.hpp"
#include "http_message.hpp"

// What happened to an export that got as far as its sink
struct ExportReport
{
    std::string format;
    ArtifactKind kind{ArtifactKind::Text};
    size_t bytes{0};                        // bytes accepted by the sink
    std::optional<ExportError> sink_error;  // set (and already logged) when delivery failed

    bool delivered() const { return !sink_error.has_value(); }
};

// Entry point for the export commands.
//
// Unknown formats and flows lacking the side a format needs are returned as
// errors and abort the export. A sink failure does not: it is logged and
// recorded in the returned report, because the artifact itself was fine.
class ExportService
{
   public:
    explicit ExportService(const FormatRegistry& registry = FormatRegistry::instance(),
                           const std::string& clipboard_command = "");

    std::vector<std::string> listFormats() const;
    ExportResult<std::string> describeFormat(const std::string& format) const;

    ExportResult<ExportArtifact> render(const std::string& format, const HttpFlow& flow) const;

    ExportResult<ExportReport> exportToFile(const std::string& format, const HttpFlow& flow,
                                            const std::string& path) const;
    ExportResult<ExportReport> exportToClipboard(const std::string& format,
                                                 const HttpFlow& flow) const;
    ExportResult<ExportReport> exportToSink(const std::string& format, const HttpFlow& flow,
                                            ExportSink& sink) const;

   private:
    const FormatRegistry& m_registry;
    std::string m_clipboard_command;
};

#endif  // EXPORT_SERVICE_HPP
