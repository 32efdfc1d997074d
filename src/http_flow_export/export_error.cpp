#include "export_error.hpp"

const char* export_error_code_name(ExportErrorCode code)
{
    switch (code)
    {
        case ExportErrorCode::NoRequest:
            return "NoRequest";
        case ExportErrorCode::NoResponse:
            return "NoResponse";
        case ExportErrorCode::NoContent:
            return "NoContent";
        case ExportErrorCode::UnknownFormat:
            return "UnknownFormat";
        case ExportErrorCode::Sink:
            return "Sink";
    }
    return "Unknown";
}
