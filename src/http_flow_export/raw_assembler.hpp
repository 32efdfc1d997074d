#ifndef RAW_ASSEMBLER_HPP
#define RAW_ASSEMBLER_HPP

#include <string>

#include "export_error.hpp"
#include "http_message.hpp"

// Serializes messages into HTTP/1.x wire bytes: start line, one
// "Name: value\r\n" per header field (order and duplicates kept), an empty
// line, then the body verbatim
class RawAssembler
{
   public:
    // Placed between request and response in combined output
    static constexpr const char* SEPARATOR = "\r\n\r\n";

    static Bytes assembleRequest(const HttpRequest& request);
    static Bytes assembleResponse(const HttpResponse& response);

    // Sanitizes both sides of the flow; request + SEPARATOR + response when
    // both exist, the present side alone otherwise
    static ExportResult<Bytes> assembleCombined(const HttpFlow& flow);

    static std::string requestLine(const HttpRequest& request);
    static std::string statusLine(const HttpResponse& response);

   private:
    static void appendHead(Bytes& out, const std::string& start_line, const HttpHeaders& headers);
};

#endif  // RAW_ASSEMBLER_HPP
