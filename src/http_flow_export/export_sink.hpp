#ifndef EXPORT_SINK_HPP
#define EXPORT_SINK_HPP

#include <cstddef>
#include <string>

#include "export_artifact.hpp"
#include "export_error.hpp"

// Number of bytes handed to the destination, or a Sink error
using SinkResult = ExportResult<size_t>;

// Abstract destination for an exported artifact (file, clipboard, ...)
class ExportSink
{
   public:
    virtual ~ExportSink() = default;

    // Write the artifact. Failures come back as an ExportErrorCode::Sink error,
    // never as an exception; the destination is released on every path.
    virtual SinkResult deliver(const ExportArtifact& artifact) = 0;

    // Human readable destination for log lines, e.g. "file out.txt"
    virtual std::string describe() const = 0;
};

#endif  // EXPORT_SINK_HPP
