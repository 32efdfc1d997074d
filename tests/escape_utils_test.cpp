#include <gtest/gtest.h>

#include "escape_utils.hpp"
#include "export_artifact.hpp"

TEST(EscapeUtilsTest, SingleQuoteIsClosedAndReopened)
{
    EXPECT_EQ(bytes_to_escaped_str(to_bytes("a'b")), "a'\"'\"'b");
    EXPECT_EQ(shell_single_quote("it's"), "'it'\"'\"'s'");
}

TEST(EscapeUtilsTest, PrintableAsciiPassesThrough)
{
    std::string text = "{\"key\": \"va\\lue\", \"n\": [1, 2]} ~!@#$%^&*()";
    EXPECT_EQ(bytes_to_escaped_str(to_bytes(text)), text);
}

TEST(EscapeUtilsTest, ControlBytesAreEscaped)
{
    Bytes data{'a', '\n', 'b', '\r', '\t', 0x00, 0x1b, 0x7f};
    EXPECT_EQ(bytes_to_escaped_str(data), "a\\nb\\r\\t\\x00\\x1b\\x7f");
}

TEST(EscapeUtilsTest, Utf8IsKeptAndInvalidBytesAreEscaped)
{
    // "é" then a stray continuation byte, a truncated 3-byte lead and an overlong '/'
    Bytes data{0xC3, 0xA9, 0x80, 0xE2, 0x82, 0xC0, 0xAF};
    EXPECT_EQ(bytes_to_escaped_str(data), "\xC3\xA9\\x80\\xe2\\x82\\xc0\\xaf");
}

TEST(EscapeUtilsTest, Utf8Validation)
{
    EXPECT_TRUE(is_valid_utf8(to_bytes("plain ascii")));
    EXPECT_TRUE(is_valid_utf8(Bytes{0xE2, 0x82, 0xAC}));          // euro sign
    EXPECT_TRUE(is_valid_utf8(Bytes{0xF0, 0x9F, 0x98, 0x80}));    // emoji
    EXPECT_FALSE(is_valid_utf8(Bytes{0xED, 0xA0, 0x80}));         // surrogate
    EXPECT_FALSE(is_valid_utf8(Bytes{0xF4, 0x90, 0x80, 0x80}));   // above U+10FFFF
    EXPECT_FALSE(is_valid_utf8(Bytes{0xE0, 0x80, 0xAF}));         // overlong
    EXPECT_FALSE(is_valid_utf8(Bytes{0xFF}));
}

TEST(EscapeUtilsTest, DisplayStringKeepsFramingAndEscapesBinary)
{
    Bytes data = to_bytes("HTTP/1.1 200 OK\r\n\r\n");
    data.push_back(0x89);
    data.push_back('P');
    EXPECT_EQ(bytes_to_display_str(data), "HTTP/1.1 200 OK\r\n\r\n\\x89P");
}

TEST(EscapeUtilsTest, DisplayStringEscapesBackslashes)
{
    EXPECT_EQ(bytes_to_display_str(to_bytes("no escapes here")), "no escapes here");
    EXPECT_EQ(bytes_to_display_str(to_bytes("{\"a\":\"\\\"\"}")), "{\"a\":\"\\\\\"\"}");
    EXPECT_EQ(bytes_to_display_str(Bytes{'\\', 0xFF}), "\\\\\\xff");
}

TEST(ExportArtifactTest, ClipboardTextDistinguishesEscapedLookalikes)
{
    auto binary = ExportArtifact::fromBytes(Bytes{'x', 0x89});
    auto literal = ExportArtifact::fromBytes(to_bytes("x\\x89"));

    EXPECT_EQ(binary.toClipboardText(), "x\\x89");
    EXPECT_EQ(literal.toClipboardText(), "x\\\\x89");
    EXPECT_NE(binary.toClipboardText(), literal.toClipboardText());
}

TEST(ExportArtifactTest, ClipboardTextForEachKind)
{
    auto text = ExportArtifact::fromText("curl 'http://example.com/'");
    EXPECT_EQ(text.kind(), ArtifactKind::Text);
    EXPECT_EQ(text.toClipboardText(), "curl 'http://example.com/'");

    auto valid = ExportArtifact::fromBytes(to_bytes("GET / HTTP/1.1\r\n\r\n"));
    EXPECT_EQ(valid.kind(), ArtifactKind::Bytes);
    EXPECT_EQ(valid.toClipboardText(), "GET / HTTP/1.1\r\n\r\n");

    auto binary = ExportArtifact::fromBytes(Bytes{'a', 0xFE, 'b'});
    EXPECT_EQ(binary.size(), 3u);
    EXPECT_EQ(binary.toClipboardText(), "a\\xfeb");
}
