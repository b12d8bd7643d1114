#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace trellis {

// Primary key type
using primary_key_t = int64_t;

/// Identifies a unique row within one table.
struct row_id {
    primary_key_t value = 0;

    row_id() = default;
    explicit row_id(primary_key_t v) : value(v) {}

    std::string to_string() const { return std::to_string(value); }

    bool operator==(const row_id& other) const { return value == other.value; }
    bool operator!=(const row_id& other) const { return value != other.value; }
    bool operator<(const row_id& other) const { return value < other.value; }
};

inline std::ostream& operator<<(std::ostream& os, const row_id& id) {
    return os << id.value;
}

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Column type enumeration
enum class column_type {
    integer,
    real,
    text,
    blob
};

inline const char* sql_type_name(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
    }
    return "TEXT";
}

/// Name of the variant alternative a value holds, as SQLite reports it.
inline const char* value_type_name(const column_value_t& value) {
    switch (value.index()) {
        case 0: return "Null";
        case 1: return "Integer";
        case 2: return "Real";
        case 3: return "Text";
        case 4: return "Blob";
    }
    return "Null";
}

// Column definition for schema
struct column_def {
    std::string name;
    column_type type;
};

// Table schema. Every table also gets an "id" primary key column.
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
};

namespace detail {
    // Type traits
    template<typename T> struct is_optional : std::false_type {};
    template<typename T> struct is_optional<std::optional<T>> : std::true_type {};
} // namespace detail

} // namespace trellis
