#ifndef HTTP_FLOW_EXPORT_APP_HPP
#define HTTP_FLOW_EXPORT_APP_HPP

#include <optional>
#include <string>
#include <vector>

#include "export_service.hpp"
#include "http_message.hpp"

enum class ExportCommand
{
    Formats,    // list format names
    File,       // export <format> to <path>
    Clip        // export <format> to the clipboard
};

// Everything main() collected from the command line
struct FlowExportOptions
{
    ExportCommand command{ExportCommand::Formats};
    std::string format;
    std::string path;

    // Request side, present when url is set
    std::optional<std::string> url;
    std::string method{"GET"};
    std::string http_version{"HTTP/1.1"};
    std::vector<std::string> request_headers;      // "Name: value"
    std::optional<std::string> request_body;
    std::optional<std::string> request_body_file;

    // Response side, present when status is set
    std::optional<int> status;
    std::string reason;
    std::vector<std::string> response_headers;
    std::optional<std::string> response_body;
    std::optional<std::string> response_body_file;

    std::string clipboard_command;
};

class HttpFlowExportApp
{
  public:
    explicit HttpFlowExportApp(const FlowExportOptions& options);
    ~HttpFlowExportApp();

    // Process exit code: 0 on success (including a reported sink failure),
    // 1 when the export could not be produced
    int run();

    // Builds the flow described by the options; false with error set on bad input
    static bool buildFlow(const FlowExportOptions& options, HttpFlow& flow, std::string& error);

    // Splits "Name: value"; false when there is no ':' or the name is empty
    static bool parseHeaderArgument(const std::string& argument, HttpHeader& header);

  private:
    static bool readFile(const std::string& path, Bytes& out, std::string& error);

    FlowExportOptions options_;
    ExportService service_;
};

#endif // HTTP_FLOW_EXPORT_APP_HPP
