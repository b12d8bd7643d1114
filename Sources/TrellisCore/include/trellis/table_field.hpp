#pragma once

#include "types.hpp"
#include "error.hpp"
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// ============================================================================
// Field marshallers
//
// table_field<T> converts between a record field of type T and the value
// stored in its SQLite column. Every type used in a TRELLIS_TABLE record
// needs a specialization:
//
//   static constexpr column_type column;            // CREATE TABLE column type
//   static column_value_t to_column_value(const T&);
//   static T from_column_value(const column_value_t&);   // throws db_error
//   static std::string to_display_string(const T&);
// ============================================================================

template<typename T>
struct table_field;

namespace detail {

[[noreturn]] void throw_field_type_error(const char* expected, const column_value_t& got);

/// Parses a whole string as a signed 64-bit integer.
std::optional<int64_t> parse_integer(const std::string& text);

int64_t integer_from_column(const column_value_t& value, const char* expected);

} // namespace detail

template<>
struct table_field<std::string> {
    static constexpr column_type column = column_type::text;

    static column_value_t to_column_value(const std::string& v) { return v; }

    static std::string from_column_value(const column_value_t& value) {
        if (auto* s = std::get_if<std::string>(&value)) {
            return *s;
        }
        detail::throw_field_type_error("Text", value);
    }

    static std::string to_display_string(const std::string& v) { return v; }
};

template<>
struct table_field<int64_t> {
    static constexpr column_type column = column_type::integer;

    static column_value_t to_column_value(int64_t v) { return v; }

    static int64_t from_column_value(const column_value_t& value) {
        return detail::integer_from_column(value, "Integer");
    }

    static std::string to_display_string(int64_t v) { return std::to_string(v); }
};

template<>
struct table_field<int> {
    static constexpr column_type column = column_type::integer;

    static column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }

    static int from_column_value(const column_value_t& value) {
        int64_t v = detail::integer_from_column(value, "Integer");
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw db_error("Integer " + std::to_string(v) + " out of range for int field");
        }
        return static_cast<int>(v);
    }

    static std::string to_display_string(int v) { return std::to_string(v); }
};

template<>
struct table_field<bool> {
    static constexpr column_type column = column_type::integer;

    static column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }

    static bool from_column_value(const column_value_t& value) {
        return detail::integer_from_column(value, "Integer") != 0;
    }

    static std::string to_display_string(bool v) { return v ? "true" : "false"; }
};

template<>
struct table_field<double> {
    static constexpr column_type column = column_type::real;

    static column_value_t to_column_value(double v) { return v; }

    static double from_column_value(const column_value_t& value);

    static std::string to_display_string(double v);
};

template<>
struct table_field<row_id> {
    static constexpr column_type column = column_type::integer;

    static column_value_t to_column_value(const row_id& v) { return v.value; }

    static row_id from_column_value(const column_value_t& value) {
        return row_id(detail::integer_from_column(value, "Integer"));
    }

    static std::string to_display_string(const row_id& v) { return v.to_string(); }
};

/// Ordered list of row ids, stored as comma-joined text ("1,2,3").
/// Empty text is an empty list; a non-numeric segment is a db_error.
template<>
struct table_field<std::vector<row_id>> {
    static constexpr column_type column = column_type::text;

    static column_value_t to_column_value(const std::vector<row_id>& v) {
        return to_display_string(v);
    }

    static std::vector<row_id> from_column_value(const column_value_t& value);

    static std::string to_display_string(const std::vector<row_id>& v);
};

/// Optional fields read NULL or an unparsable value as absent.
template<typename T>
struct table_field<std::optional<T>> {
    static constexpr column_type column = table_field<T>::column;

    static column_value_t to_column_value(const std::optional<T>& v) {
        if (!v) return nullptr;
        return table_field<T>::to_column_value(*v);
    }

    static std::optional<T> from_column_value(const column_value_t& value) {
        if (std::holds_alternative<std::nullptr_t>(value)) {
            return std::nullopt;
        }
        try {
            return table_field<T>::from_column_value(value);
        } catch (const db_error&) {
            return std::nullopt;
        }
    }

    static std::string to_display_string(const std::optional<T>& v) {
        return v ? table_field<T>::to_display_string(*v) : std::string();
    }
};

} // namespace trellis
