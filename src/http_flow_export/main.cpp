#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "http_flow_export_app.hpp"
#include "logger.hpp"

static void usage(const char* prog)
{
    std::cerr << "Usage: " << prog << " <command> [options]\n";
    std::cerr << "Commands:\n";
    std::cerr << "  formats                  List export formats\n";
    std::cerr << "  file <format> <path>     Export the flow to a file\n";
    std::cerr << "  clip <format>            Export the flow to the clipboard\n";
    std::cerr << "Request:\n";
    std::cerr << "  -u <url>                 Request URL (creates the request)\n";
    std::cerr << "  -X <method>              Request method (default: GET)\n";
    std::cerr << "  -H <'Name: value'>       Request header, repeatable\n";
    std::cerr << "  -d <data>                Request body\n";
    std::cerr << "  --data-file <path>       Request body from file\n";
    std::cerr << "  --http-version <ver>     HTTP version (default: HTTP/1.1)\n";
    std::cerr << "Response:\n";
    std::cerr << "  -s <status>              Status code (creates the response)\n";
    std::cerr << "  -r <reason>              Reason phrase (default: standard phrase)\n";
    std::cerr << "  -R <'Name: value'>       Response header, repeatable\n";
    std::cerr << "  -b <body>                Response body\n";
    std::cerr << "  --body-file <path>       Response body from file\n";
    std::cerr << "Other:\n";
    std::cerr << "  --clip-cmd <command>     Clipboard command (default: detected)\n";
    std::cerr << "  -v <level>               Log level: 0=DEBUG, 1=INFO, 2=WARNING, 3=ERROR (default: 2)\n";
    std::cerr << "  --quiet                  Disable all logging\n";
    std::cerr << "  --timestamp              Show timestamps in logs\n";
}

int main(int argc, char** argv)
{
    FlowExportOptions options;
    LogLevel log_level = LogLevel::WARNING;
    bool show_timestamp = false;

    if (argc < 2)
    {
        usage(argv[0]);
        return 1;
    }

    int i = 1;
    if (std::strcmp(argv[i], "formats") == 0)
    {
        options.command = ExportCommand::Formats;
        i += 1;
    }
    else if (std::strcmp(argv[i], "file") == 0 && i + 2 < argc)
    {
        options.command = ExportCommand::File;
        options.format = argv[i + 1];
        options.path = argv[i + 2];
        i += 3;
    }
    else if (std::strcmp(argv[i], "clip") == 0 && i + 1 < argc)
    {
        options.command = ExportCommand::Clip;
        options.format = argv[i + 1];
        i += 2;
    }
    else
    {
        usage(argv[0]);
        return 1;
    }

    for (; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "-u") == 0 && i + 1 < argc)
        {
            options.url = argv[++i];
        }
        else if (std::strcmp(argv[i], "-X") == 0 && i + 1 < argc)
        {
            options.method = argv[++i];
        }
        else if (std::strcmp(argv[i], "-H") == 0 && i + 1 < argc)
        {
            options.request_headers.push_back(argv[++i]);
        }
        else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc)
        {
            options.request_body = argv[++i];
        }
        else if (std::strcmp(argv[i], "--data-file") == 0 && i + 1 < argc)
        {
            options.request_body_file = argv[++i];
        }
        else if (std::strcmp(argv[i], "--http-version") == 0 && i + 1 < argc)
        {
            options.http_version = argv[++i];
        }
        else if (std::strcmp(argv[i], "-s") == 0 && i + 1 < argc)
        {
            int status = std::atoi(argv[++i]);
            if (status < 100 || status > 999)
            {
                std::cerr << "Invalid status code. Use 100-999.\n";
                return 1;
            }
            options.status = status;
        }
        else if (std::strcmp(argv[i], "-r") == 0 && i + 1 < argc)
        {
            options.reason = argv[++i];
        }
        else if (std::strcmp(argv[i], "-R") == 0 && i + 1 < argc)
        {
            options.response_headers.push_back(argv[++i]);
        }
        else if (std::strcmp(argv[i], "-b") == 0 && i + 1 < argc)
        {
            options.response_body = argv[++i];
        }
        else if (std::strcmp(argv[i], "--body-file") == 0 && i + 1 < argc)
        {
            options.response_body_file = argv[++i];
        }
        else if (std::strcmp(argv[i], "--clip-cmd") == 0 && i + 1 < argc)
        {
            options.clipboard_command = argv[++i];
        }
        else if (std::strcmp(argv[i], "-v") == 0 && i + 1 < argc)
        {
            int level = std::atoi(argv[++i]);
            if (level >= 0 && level <= 3)
            {
                log_level = static_cast<LogLevel>(level);
            }
            else
            {
                std::cerr << "Invalid log level. Use 0-3.\n";
                return 1;
            }
        }
        else if (std::strcmp(argv[i], "--quiet") == 0)
        {
            log_level = LogLevel::NONE;
        }
        else if (std::strcmp(argv[i], "--timestamp") == 0)
        {
            show_timestamp = true;
        }
        else
        {
            usage(argv[0]);
            return 1;
        }
    }

    Logger::setLevel(log_level);
    Logger::setShowTimestamp(show_timestamp);

    LOG_DEBUG("Log level: " << static_cast<int>(log_level));

    HttpFlowExportApp app(options);
    return app.run();
}
