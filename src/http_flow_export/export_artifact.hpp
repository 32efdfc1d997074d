#ifndef EXPORT_ARTIFACT_HPP
#define EXPORT_ARTIFACT_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

#include "http_message.hpp"

enum class ArtifactKind
{
    Text,   // shell commands, written as UTF-8
    Bytes   // raw wire data, written verbatim
};

// Output of a formatter, tagged with its kind so sinks can branch on the tag
class ExportArtifact
{
   public:
    static ExportArtifact fromText(std::string text);
    static ExportArtifact fromBytes(Bytes bytes);

    ArtifactKind kind() const;
    size_t size() const;

    // Only valid for the matching kind
    const std::string& text() const { return std::get<std::string>(m_data); }
    const Bytes& bytes() const { return std::get<Bytes>(m_data); }

    // Deterministic text form for the clipboard. Text passes through; bytes
    // pass through when they are well-formed UTF-8, otherwise each byte that
    // is not part of a valid sequence becomes \xNN.
    std::string toClipboardText() const;

   private:
    explicit ExportArtifact(std::variant<std::string, Bytes> data) : m_data(std::move(data)) {}

    std::variant<std::string, Bytes> m_data;
};

const char* artifact_kind_name(ArtifactKind kind);

#endif  // EXPORT_ARTIFACT_HPP
