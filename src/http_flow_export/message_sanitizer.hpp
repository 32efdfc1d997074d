#ifndef MESSAGE_SANITIZER_HPP
#define MESSAGE_SANITIZER_HPP

#include <optional>

#include "export_error.hpp"
#include "http_message.hpp"

// Produces exportable copies of the messages in a flow. The flow itself is
// never touched; each call returns an independent copy with:
//   - Content-Encoding undone where possible (left as-is otherwise)
//   - Content-Length: 0 dropped from GET requests
//   - the :authority pseudo-header dropped
class MessageSanitizer
{
   public:
    static ExportResult<HttpRequest> sanitizeRequest(const HttpFlow& flow);
    static ExportResult<HttpResponse> sanitizeResponse(const HttpFlow& flow);

    // Lenient decode pass. Returns true when the content was decoded and the
    // headers adjusted; false leaves headers and content untouched.
    static bool decodeContent(HttpHeaders& headers, std::optional<Bytes>& content);
};

#endif  // MESSAGE_SANITIZER_HPP
