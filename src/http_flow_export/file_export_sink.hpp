#ifndef FILE_EXPORT_SINK_HPP
#define FILE_EXPORT_SINK_HPP

#include "export_sink.hpp"

// Writes the artifact to a file, replacing its contents. Bytes are written
// verbatim, text as UTF-8 without newline translation.
class FileExportSink : public ExportSink
{
   public:
    explicit FileExportSink(const std::string& path) : m_path(path) {}
    ~FileExportSink() override = default;

    SinkResult deliver(const ExportArtifact& artifact) override;
    std::string describe() const override { return "file " + m_path; }

   private:
    std::string m_path;
};

#endif  // FILE_EXPORT_SINK_HPP
