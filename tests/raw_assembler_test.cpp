#include <gtest/gtest.h>
#include <picohttpparser.h>

#include <string>
#include <vector>

#include "message_sanitizer.hpp"
#include "raw_assembler.hpp"
#include "test_helpers.hpp"

namespace
{
std::vector<HttpHeader> to_headers(const phr_header* headers, size_t num_headers)
{
    std::vector<HttpHeader> out;
    for (size_t i = 0; i < num_headers; ++i)
    {
        out.push_back(HttpHeader{std::string(headers[i].name, headers[i].name_len),
                                 std::string(headers[i].value, headers[i].value_len)});
    }
    return out;
}

void expect_same_headers(const std::vector<HttpHeader>& parsed, const HttpHeaders& expected)
{
    ASSERT_EQ(parsed.size(), expected.size());
    for (size_t i = 0; i < parsed.size(); ++i)
    {
        EXPECT_EQ(parsed[i].name, expected.fields()[i].name);
        EXPECT_EQ(parsed[i].value, expected.fields()[i].value);
    }
}
}  // namespace

TEST(RawAssemblerTest, RequestBytesAreExact)
{
    HttpRequest request = make_request("POST", "http://example.com/submit?x=1",
                                       {{"Host", "example.com"},
                                        {"Cookie", "a=1"},
                                        {"Cookie", "b=2"},
                                        {"Content-Length", "3"}});
    request.content = to_bytes("a=b");

    EXPECT_EQ(to_string(RawAssembler::assembleRequest(request)),
              "POST /submit?x=1 HTTP/1.1\r\n"
              "Host: example.com\r\n"
              "Cookie: a=1\r\n"
              "Cookie: b=2\r\n"
              "Content-Length: 3\r\n"
              "\r\n"
              "a=b");
}

TEST(RawAssemblerTest, ResponseBytesAreExact)
{
    HttpResponse response = make_response(404, "Not Found", {{"Content-Type", "text/plain"}}, "nope");
    EXPECT_EQ(to_string(RawAssembler::assembleResponse(response)),
              "HTTP/1.1 404 Not Found\r\n"
              "Content-Type: text/plain\r\n"
              "\r\n"
              "nope");
}

TEST(RawAssemblerTest, RequestTargetFollowsForm)
{
    HttpRequest request = make_request("GET", "http://example.com:8080/a");
    request.form = RequestForm::Absolute;
    EXPECT_EQ(RawAssembler::requestLine(request), "GET http://example.com:8080/a HTTP/1.1");

    HttpRequest connect = make_request("CONNECT", "https://example.com/");
    connect.form = RequestForm::Authority;
    EXPECT_EQ(RawAssembler::requestLine(connect), "CONNECT example.com:443 HTTP/1.1");
}

TEST(RawAssemblerTest, BinaryBodyIsVerbatim)
{
    HttpResponse response = make_response(200, "OK");
    response.content = Bytes{0x00, 0xFF, '\r', '\n', 0x80};
    Bytes raw = RawAssembler::assembleResponse(response);
    ASSERT_GE(raw.size(), 5u);
    EXPECT_EQ(Bytes(raw.end() - 5, raw.end()), (Bytes{0x00, 0xFF, '\r', '\n', 0x80}));
}

TEST(RawAssemblerTest, RequestRoundTripsThroughParser)
{
    HttpFlow flow;
    flow.request = make_request("PUT", "http://api.example.com/items/7",
                                {{"Host", "api.example.com"},
                                 {"X-Dup", "one"},
                                 {"Accept", "*/*"},
                                 {"x-dup", "two"},
                                 {"Content-Length", "13"}});
    flow.request->content = to_bytes("{\"id\": \"7\"}\r\n");
    HttpRequest sanitized = MessageSanitizer::sanitizeRequest(flow).value();

    std::string raw = to_string(RawAssembler::assembleRequest(sanitized));

    const char* method = nullptr;
    size_t method_len = 0;
    const char* path = nullptr;
    size_t path_len = 0;
    int minor_version = -1;
    phr_header headers[32];
    size_t num_headers = sizeof(headers) / sizeof(headers[0]);
    int head_len = phr_parse_request(raw.data(), raw.size(), &method, &method_len, &path,
                                     &path_len, &minor_version, headers, &num_headers, 0);
    ASSERT_GT(head_len, 0);

    EXPECT_EQ(std::string(method, method_len), "PUT");
    EXPECT_EQ(std::string(path, path_len), "/items/7");
    EXPECT_EQ(minor_version, 1);
    expect_same_headers(to_headers(headers, num_headers), sanitized.headers);
    EXPECT_EQ(raw.substr(static_cast<size_t>(head_len)), to_string(*sanitized.content));
}

TEST(RawAssemblerTest, ResponseRoundTripsThroughParser)
{
    HttpFlow flow;
    flow.response = make_response(302, "Found",
                                  {{"Location", "/login"},
                                   {"Set-Cookie", "session=1; Path=/"},
                                   {"Set-Cookie", "theme=dark"}},
                                  "moved");
    HttpResponse sanitized = MessageSanitizer::sanitizeResponse(flow).value();

    std::string raw = to_string(RawAssembler::assembleResponse(sanitized));

    int minor_version = -1;
    int status = 0;
    const char* msg = nullptr;
    size_t msg_len = 0;
    phr_header headers[32];
    size_t num_headers = sizeof(headers) / sizeof(headers[0]);
    int head_len = phr_parse_response(raw.data(), raw.size(), &minor_version, &status, &msg,
                                      &msg_len, headers, &num_headers, 0);
    ASSERT_GT(head_len, 0);

    EXPECT_EQ(status, 302);
    EXPECT_EQ(std::string(msg, msg_len), "Found");
    expect_same_headers(to_headers(headers, num_headers), sanitized.headers);
    EXPECT_EQ(raw.substr(static_cast<size_t>(head_len)), "moved");
}

TEST(RawAssemblerTest, CombinedIsRequestSeparatorResponse)
{
    HttpFlow flow;
    flow.request = make_request("GET", "http://example.com/",
                                {{"Host", "example.com"}, {"Content-Length", "0"}});
    flow.response = make_response(200, "OK", {{"Content-Length", "2"}}, "hi");

    auto combined = RawAssembler::assembleCombined(flow);
    ASSERT_TRUE(combined.ok());

    Bytes expected = RawAssembler::assembleRequest(MessageSanitizer::sanitizeRequest(flow).value());
    Bytes separator = to_bytes("\r\n\r\n");
    expected.insert(expected.end(), separator.begin(), separator.end());
    Bytes response = RawAssembler::assembleResponse(MessageSanitizer::sanitizeResponse(flow).value());
    expected.insert(expected.end(), response.begin(), response.end());

    EXPECT_EQ(combined.value(), expected);
    EXPECT_EQ(to_string(combined.value()),
              "GET / HTTP/1.1\r\nHost: example.com\r\n\r\n"
              "\r\n\r\n"
              "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi");
}

TEST(RawAssemblerTest, CombinedWithOneSideIsThatSideAlone)
{
    HttpFlow request_only;
    request_only.request = make_request("GET", "http://example.com/");
    EXPECT_EQ(RawAssembler::assembleCombined(request_only).value(),
              RawAssembler::assembleRequest(*request_only.request));

    HttpFlow response_only;
    response_only.response = make_response(204, "No Content");
    EXPECT_EQ(RawAssembler::assembleCombined(response_only).value(),
              RawAssembler::assembleResponse(*response_only.response));
}

TEST(RawAssemblerTest, CombinedWithNothingIsNoContent)
{
    auto combined = RawAssembler::assembleCombined(HttpFlow{});
    ASSERT_FALSE(combined.ok());
    EXPECT_EQ(combined.error().code, ExportErrorCode::NoContent);
}
