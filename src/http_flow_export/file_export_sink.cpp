#include "file_export_sink.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include "logger.hpp"

namespace
{
std::string errno_text()
{
    return errno != 0 ? std::strerror(errno) : "unknown error";
}
}  // namespace

SinkResult FileExportSink::deliver(const ExportArtifact& artifact)
{
    errno = 0;
    std::ofstream out(m_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        return ExportError::sink("Failed to open " + m_path + " for writing: " + errno_text());
    }

    const char* data = nullptr;
    size_t size = artifact.size();
    if (artifact.kind() == ArtifactKind::Bytes)
    {
        data = reinterpret_cast<const char*>(artifact.bytes().data());
    }
    else
    {
        // std::string already holds the UTF-8 encoding
        data = artifact.text().data();
    }

    out.write(data, static_cast<std::streamsize>(size));
    out.flush();
    if (!out)
    {
        return ExportError::sink("Failed to write " + m_path + ": " + errno_text());
    }

    out.close();
    if (out.fail())
    {
        return ExportError::sink("Failed to close " + m_path + ": " + errno_text());
    }

    LOG_DEBUG("Wrote " << size << " " << artifact_kind_name(artifact.kind()) << " to " << m_path);
    return size;
}
