#include "trellis/table_field.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace trellis {
namespace detail {

void throw_field_type_error(const char* expected, const column_value_t& got) {
    throw db_error(std::string("Invalid column type ") + value_type_name(got) +
                   ", expected " + expected);
}

std::optional<int64_t> parse_integer(const std::string& text) {
    // strtoll skips leading whitespace; a field value must not start with it
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

int64_t integer_from_column(const column_value_t& value, const char* expected) {
    if (auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    // Text that SQLite could not coerce on write, e.g. "007" in a TEXT column
    if (auto* s = std::get_if<std::string>(&value)) {
        if (auto parsed = parse_integer(*s)) {
            return *parsed;
        }
    }
    throw_field_type_error(expected, value);
}

} // namespace detail

double table_field<double>::from_column_value(const column_value_t& value) {
    if (auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (auto* i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    detail::throw_field_type_error("Real", value);
}

std::string table_field<double>::to_display_string(double v) {
    std::ostringstream out;
    out << v;
    return out.str();
}

std::vector<row_id> table_field<std::vector<row_id>>::from_column_value(const column_value_t& value) {
    auto* text = std::get_if<std::string>(&value);
    if (!text) {
        detail::throw_field_type_error("Text", value);
    }

    std::vector<row_id> ids;
    if (text->empty()) {
        return ids;
    }

    size_t start = 0;
    while (start <= text->size()) {
        size_t comma = text->find(',', start);
        if (comma == std::string::npos) comma = text->size();
        std::string segment = text->substr(start, comma - start);
        auto parsed = detail::parse_integer(segment);
        if (!parsed) {
            throw db_error("Invalid row id \"" + segment + "\" in list \"" + *text + "\"");
        }
        ids.emplace_back(*parsed);
        start = comma + 1;
    }
    return ids;
}

std::string table_field<std::vector<row_id>>::to_display_string(const std::vector<row_id>& v) {
    std::string joined;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) joined += ',';
        joined += v[i].to_string();
    }
    return joined;
}

} // namespace trellis
