#include "export_artifact.hpp"

#include "escape_utils.hpp"

ExportArtifact ExportArtifact::fromText(std::string text)
{
    return ExportArtifact(std::variant<std::string, Bytes>(std::in_place_index<0>, std::move(text)));
}

ExportArtifact ExportArtifact::fromBytes(Bytes bytes)
{
    return ExportArtifact(std::variant<std::string, Bytes>(std::in_place_index<1>, std::move(bytes)));
}

ArtifactKind ExportArtifact::kind() const
{
    return m_data.index() == 0 ? ArtifactKind::Text : ArtifactKind::Bytes;
}

size_t ExportArtifact::size() const
{
    if (kind() == ArtifactKind::Text)
    {
        return text().size();
    }
    return bytes().size();
}

std::string ExportArtifact::toClipboardText() const
{
    if (kind() == ArtifactKind::Text)
    {
        return text();
    }
    return bytes_to_display_str(bytes());
}

const char* artifact_kind_name(ArtifactKind kind)
{
    switch (kind)
    {
        case ArtifactKind::Text:
            return "text";
        case ArtifactKind::Bytes:
            return "bytes";
    }
    return "unknown";
}
