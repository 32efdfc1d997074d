#ifndef HTTP_HEADERS_HPP
#define HTTP_HEADERS_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

struct HttpHeader
{
    std::string name;
    std::string value;
};

// Ordered multimap of header fields. Names compare case-insensitively for
// lookup, but every entry keeps its original spelling, position and
// duplicates (e.g. repeated Set-Cookie).
class HttpHeaders
{
   public:
    using const_iterator = std::vector<HttpHeader>::const_iterator;

    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<HttpHeader> fields) : m_fields(fields) {}

    // Append a field after all existing ones
    void add(const std::string& name, const std::string& value);

    // Replace the value of the first matching field in place and drop later
    // matches; append when the name is absent
    void set(const std::string& name, const std::string& value);

    // Value of the first matching field
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> getAll(const std::string& name) const;
    bool contains(const std::string& name) const;

    // Removes every matching field, returns how many were removed
    size_t remove(const std::string& name);

    const_iterator begin() const { return m_fields.begin(); }
    const_iterator end() const { return m_fields.end(); }
    size_t size() const { return m_fields.size(); }
    bool empty() const { return m_fields.empty(); }
    const std::vector<HttpHeader>& fields() const { return m_fields; }

   private:
    std::vector<HttpHeader> m_fields;
};

bool header_name_equals(const std::string& lhs, const std::string& rhs);

#endif  // HTTP_HEADERS_HPP
