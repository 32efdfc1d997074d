#include <gtest/gtest.h>

#include "format_registry.hpp"
#include "test_helpers.hpp"

TEST(FormatRegistryTest, ListsFormatsInLexicographicOrder)
{
    EXPECT_EQ(FormatRegistry::instance().listFormats(),
              (std::vector<std::string>{"curl", "httpie", "raw", "raw_request", "raw_response"}));
}

TEST(FormatRegistryTest, UnknownNamesAreRejected)
{
    for (const char* name : {"", "CURL", "json", "har", "raw-request", "curl "})
    {
        auto formatter = FormatRegistry::instance().lookup(name);
        ASSERT_FALSE(formatter.ok()) << name;
        EXPECT_EQ(formatter.error().code, ExportErrorCode::UnknownFormat);
        EXPECT_EQ(formatter.error().message, std::string("No such export format: ") + name);
    }
}

TEST(FormatRegistryTest, DeclaredKindsMatchArtifacts)
{
    HttpFlow flow;
    flow.request = make_request("GET", "http://example.com/", {{"Host", "example.com"}});
    flow.response = make_response(200, "OK", {}, "body");

    for (const auto& name : FormatRegistry::instance().listFormats())
    {
        auto formatter = FormatRegistry::instance().lookup(name);
        ASSERT_TRUE(formatter.ok()) << name;
        EXPECT_EQ(std::string(formatter.value().name), name);

        auto artifact = formatter.value().format(flow);
        ASSERT_TRUE(artifact.ok()) << name;
        EXPECT_EQ(artifact.value().kind(), formatter.value().kind) << name;
    }
}

TEST(FormatRegistryTest, EmptyFlowErrors)
{
    HttpFlow flow;
    EXPECT_EQ(format_raw(flow).error().code, ExportErrorCode::NoContent);
    EXPECT_EQ(format_curl(flow).error().code, ExportErrorCode::NoRequest);
    EXPECT_EQ(format_httpie(flow).error().code, ExportErrorCode::NoRequest);
    EXPECT_EQ(format_raw_request(flow).error().code, ExportErrorCode::NoRequest);
    EXPECT_EQ(format_raw_response(flow).error().code, ExportErrorCode::NoResponse);
}

TEST(FormatRegistryTest, ShellFormatsNeedOnlyTheRequest)
{
    HttpFlow flow;
    flow.request = make_request("GET", "http://example.com/");
    EXPECT_EQ(format_curl(flow).value().text(), "curl 'http://example.com/'");
    EXPECT_EQ(format_raw_response(flow).error().code, ExportErrorCode::NoResponse);
    EXPECT_EQ(to_string(format_raw(flow).value().bytes()), "GET / HTTP/1.1\r\n\r\n");
}

TEST(FormatRegistryTest, ErrorCodeNames)
{
    EXPECT_STREQ(export_error_code_name(ExportErrorCode::NoRequest), "NoRequest");
    EXPECT_STREQ(export_error_code_name(ExportErrorCode::UnknownFormat), "UnknownFormat");
    EXPECT_STREQ(export_error_code_name(ExportErrorCode::Sink), "Sink");
}
