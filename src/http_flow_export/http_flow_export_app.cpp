#include "http_flow_export_app.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>

#include "logger.hpp"

HttpFlowExportApp::HttpFlowExportApp(const FlowExportOptions& options)
    : options_(options),
      service_(FormatRegistry::instance(), options.clipboard_command)
{
}

HttpFlowExportApp::~HttpFlowExportApp() = default;

bool HttpFlowExportApp::parseHeaderArgument(const std::string& argument, HttpHeader& header)
{
    size_t start = !argument.empty() && argument[0] == ':' ? 1 : 0;  // pseudo-headers
    size_t colon = argument.find(':', start);
    if (colon == std::string::npos || colon == start)
    {
        return false;
    }
    header.name = argument.substr(0, colon);
    size_t value_start = argument.find_first_not_of(" \t", colon + 1);
    header.value = value_start == std::string::npos ? "" : argument.substr(value_start);
    return true;
}

bool HttpFlowExportApp::readFile(const std::string& path, Bytes& out, std::string& error)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open())
    {
        error = "Failed to open " + path;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
    {
        error = "Failed to read " + path;
        return false;
    }
    return true;
}

bool HttpFlowExportApp::buildFlow(const FlowExportOptions& options, HttpFlow& flow,
                                  std::string& error)
{
    if (options.url)
    {
        HttpRequest request;
        request.method = options.method;
        request.http_version = options.http_version;
        if (!request.setUrl(*options.url))
        {
            error = "Invalid URL: " + *options.url;
            return false;
        }
        if (request.method == "CONNECT")
        {
            request.form = RequestForm::Authority;
        }
        for (const auto& argument : options.request_headers)
        {
            HttpHeader header;
            if (!parseHeaderArgument(argument, header))
            {
                error = "Invalid header (expected 'Name: value'): " + argument;
                return false;
            }
            request.headers.add(header.name, header.value);
        }
        if (options.request_body_file)
        {
            Bytes body;
            if (!readFile(*options.request_body_file, body, error))
            {
                return false;
            }
            request.content = std::move(body);
        }
        else if (options.request_body)
        {
            request.content = to_bytes(*options.request_body);
        }
        flow.request = std::move(request);
    }

    if (options.status)
    {
        HttpResponse response;
        response.http_version = options.http_version;
        response.status_code = *options.status;
        response.reason = options.reason.empty() ? default_reason_phrase(*options.status)
                                                 : options.reason;
        for (const auto& argument : options.response_headers)
        {
            HttpHeader header;
            if (!parseHeaderArgument(argument, header))
            {
                error = "Invalid header (expected 'Name: value'): " + argument;
                return false;
            }
            response.headers.add(header.name, header.value);
        }
        if (options.response_body_file)
        {
            Bytes body;
            if (!readFile(*options.response_body_file, body, error))
            {
                return false;
            }
            response.content = std::move(body);
        }
        else if (options.response_body)
        {
            response.content = to_bytes(*options.response_body);
        }
        flow.response = std::move(response);
    }
    return true;
}

int HttpFlowExportApp::run()
{
    if (options_.command == ExportCommand::Formats)
    {
        for (const auto& name : service_.listFormats())
        {
            auto description = service_.describeFormat(name);
            std::cout << std::left << std::setw(14) << name
                      << (description ? description.value() : "") << "\n";
        }
        return 0;
    }

    HttpFlow flow;
    std::string error;
    if (!buildFlow(options_, flow, error))
    {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    LOG_DEBUG("Flow: request=" << flow.request.has_value()
              << " response=" << flow.response.has_value());

    auto result = options_.command == ExportCommand::File
                      ? service_.exportToFile(options_.format, flow, options_.path)
                      : service_.exportToClipboard(options_.format, flow);
    if (!result)
    {
        LOG_DEBUG("Export aborted: " << export_error_code_name(result.error().code));
        std::cerr << "Error: " << result.error().message << "\n";
        return 1;
    }

    // Sink failures were already logged by the service
    if (!result.value().delivered())
    {
        LOG_WARNING("Export was not delivered");
    }
    return 0;
}
