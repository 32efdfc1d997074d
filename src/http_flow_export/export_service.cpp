#include "export_service.hpp"

#include "clipboard_export_sink.hpp"
#include "file_export_sink.hpp"
#include "logger.hpp"

ExportService::ExportService(const FormatRegistry& registry, const std::string& clipboard_command)
    : m_registry(registry), m_clipboard_command(clipboard_command)
{
}

std::vector<std::string> ExportService::listFormats() const
{
    return m_registry.listFormats();
}

ExportResult<std::string> ExportService::describeFormat(const std::string& format) const
{
    auto formatter = m_registry.lookup(format);
    if (!formatter)
    {
        return formatter.error();
    }
    return std::string(formatter.value().description);
}

ExportResult<ExportArtifact> ExportService::render(const std::string& format,
                                                   const HttpFlow& flow) const
{
    auto formatter = m_registry.lookup(format);
    if (!formatter)
    {
        return formatter.error();
    }
    return formatter.value().format(flow);
}

ExportResult<ExportReport> ExportService::exportToSink(const std::string& format,
                                                       const HttpFlow& flow,
                                                       ExportSink& sink) const
{
    auto artifact = render(format, flow);
    if (!artifact)
    {
        return artifact.error();
    }

    ExportReport report;
    report.format = format;
    report.kind = artifact.value().kind();

    LOG_INFO("Exporting flow as " << format << " (" << artifact.value().size() << " "
             << artifact_kind_name(report.kind) << ") to " << sink.describe());

    SinkResult delivered = sink.deliver(artifact.value());
    if (!delivered)
    {
        LOG_ERROR("Export to " << sink.describe() << " failed: " << delivered.error().message);
        report.sink_error = delivered.error();
        return report;
    }

    report.bytes = delivered.value();
    LOG_INFO("Export complete: " << report.bytes << " bytes to " << sink.describe());
    return report;
}

ExportResult<ExportReport> ExportService::exportToFile(const std::string& format,
                                                       const HttpFlow& flow,
                                                       const std::string& path) const
{
    FileExportSink sink(path);
    return exportToSink(format, flow, sink);
}

ExportResult<ExportReport> ExportService::exportToClipboard(const std::string& format,
                                                            const HttpFlow& flow) const
{
    ClipboardExportSink sink(m_clipboard_command);
    return exportToSink(format, flow, sink);
}
