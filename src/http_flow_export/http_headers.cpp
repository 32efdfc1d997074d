#include "http_headers.hpp"

#include <algorithm>
#include <cctype>

bool header_name_equals(const std::string& lhs, const std::string& rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i])))
        {
            return false;
        }
    }
    return true;
}

void HttpHeaders::add(const std::string& name, const std::string& value)
{
    m_fields.push_back(HttpHeader{name, value});
}

void HttpHeaders::set(const std::string& name, const std::string& value)
{
    auto first = std::find_if(m_fields.begin(), m_fields.end(), [&](const HttpHeader& field) {
        return header_name_equals(field.name, name);
    });
    if (first == m_fields.end())
    {
        add(name, value);
        return;
    }

    first->value = value;
    auto tail = std::remove_if(first + 1, m_fields.end(), [&](const HttpHeader& field) {
        return header_name_equals(field.name, name);
    });
    m_fields.erase(tail, m_fields.end());
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const
{
    for (const auto& field : m_fields)
    {
        if (header_name_equals(field.name, name))
        {
            return field.value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HttpHeaders::getAll(const std::string& name) const
{
    std::vector<std::string> values;
    for (const auto& field : m_fields)
    {
        if (header_name_equals(field.name, name))
        {
            values.push_back(field.value);
        }
    }
    return values;
}

bool HttpHeaders::contains(const std::string& name) const
{
    return get(name).has_value();
}

size_t HttpHeaders::remove(const std::string& name)
{
    size_t before = m_fields.size();
    m_fields.erase(std::remove_if(m_fields.begin(), m_fields.end(),
                                  [&](const HttpHeader& field) {
                                      return header_name_equals(field.name, name);
                                  }),
                   m_fields.end());
    return before - m_fields.size();
}
