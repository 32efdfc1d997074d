#ifndef CLIPBOARD_EXPORT_SINK_HPP
#define CLIPBOARD_EXPORT_SINK_HPP

#include <optional>

#include "export_sink.hpp"

// Copies the artifact's clipboard text (ExportArtifact::toClipboardText) to
// the system clipboard by piping it into a clipboard command.
class ClipboardExportSink : public ExportSink
{
   public:
    // Empty command: pick a backend from the environment on each delivery
    explicit ClipboardExportSink(const std::string& command = "") : m_command(command) {}
    ~ClipboardExportSink() override = default;

    SinkResult deliver(const ExportArtifact& artifact) override;
    std::string describe() const override;

    // wl-copy under Wayland, xclip or xsel under X11, pbcopy on macOS;
    // std::nullopt when no usable backend is installed
    static std::optional<std::string> detectCommand();

   private:
    static bool hasTool(const std::string& tool);

    std::string m_command;
};

#endif  // CLIPBOARD_EXPORT_SINK_HPP
