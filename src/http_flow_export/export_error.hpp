#ifndef EXPORT_ERROR_HPP
#define EXPORT_ERROR_HPP

#include <string>
#include <utility>
#include <variant>

enum class ExportErrorCode
{
    NoRequest,      // export needs a request the flow does not have
    NoResponse,     // export needs a response the flow does not have
    NoContent,      // flow has neither side
    UnknownFormat,  // format name is not registered
    Sink            // file or clipboard write failed
};

struct ExportError
{
    ExportErrorCode code;
    std::string message;

    static ExportError noRequest() { return {ExportErrorCode::NoRequest, "Can't export flow with no request."}; }
    static ExportError noResponse() { return {ExportErrorCode::NoResponse, "Can't export flow with no response."}; }
    static ExportError noContent()
    {
        return {ExportErrorCode::NoContent, "Can't export flow with no request or response."};
    }
    static ExportError unknownFormat(const std::string& name)
    {
        return {ExportErrorCode::UnknownFormat, "No such export format: " + name};
    }
    static ExportError sink(const std::string& what) { return {ExportErrorCode::Sink, what}; }
};

const char* export_error_code_name(ExportErrorCode code);

// Either a value or the error that prevented producing it
template <typename T>
class ExportResult
{
   public:
    ExportResult(T value) : m_result(std::move(value)) {}
    ExportResult(ExportError error) : m_result(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(m_result); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(m_result); }
    T& value() & { return std::get<T>(m_result); }
    T&& value() && { return std::get<T>(std::move(m_result)); }

    const ExportError& error() const { return std::get<ExportError>(m_result); }

   private:
    std::variant<T, ExportError> m_result;
};

#endif  // EXPORT_ERROR_HPP
