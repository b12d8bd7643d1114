#pragma once

#include "types.hpp"
#include "error.hpp"
#include "db.hpp"
#include "db_connection.hpp"
#include "table_builder.hpp"
#include "table_config.hpp"
#include "table_field.hpp"
#include <string>
#include <utility>
#include <vector>

namespace trellis {

/// Generated row mapping for a record type. Specialized by TRELLIS_TABLE.
template<typename T>
struct table_row;

template<typename T, typename = void>
struct is_table_row : std::false_type {};

template<typename T>
struct is_table_row<T, std::void_t<typename table_row<T>::record_type>> : std::true_type {};

/// Bundles the generated functions of `Row` into the descriptor for `table_name`.
template<typename Row>
table_config make_table_config(std::string table_name) {
    static_assert(is_table_row<Row>::value, "Row must be declared with TRELLIS_TABLE");
    table_config config;
    config.table_name = std::move(table_name);
    config.setup = &table_row<Row>::setup;
    config.push_tabled_header = &table_row<Row>::push_tabled_header;
    config.push_tabled_record = &table_row<Row>::push_tabled_record;
    config.columns = &table_row<Row>::fields;
    config.field_names = &table_row<Row>::field_names;
    config.fields_as_strings = &table_row<Row>::fields_as_strings;
    return config;
}

namespace detail {

template<typename F>
std::string field_display_string(const db_connection& conn, const std::string& table, row_id id,
                                 const std::string& field) {
    try {
        return table_field<F>::to_display_string(conn.get_field_in_table_row<F>(table, id, field));
    } catch (const db_error&) {
        return {};
    }
}

} // namespace detail

} // namespace trellis

// ============================================================================
// TRELLIS_TABLE Macro System
//
// Usage:
//   struct trainer {
//       std::string name;
//       std::string email;
//   };
//   TRELLIS_TABLE(trainer, name, email)
//
// Must be invoked at global scope. Every field type needs a table_field<T>.
// ============================================================================

// FOR_EACH variadic macro helpers (recursive concatenation)
#define TFE_0(WHAT, cls)
#define TFE_1(WHAT, cls, X) WHAT(cls, X)
#define TFE_2(WHAT, cls, X, ...) WHAT(cls, X) TFE_1(WHAT, cls, __VA_ARGS__)
#define TFE_3(WHAT, cls, X, ...) WHAT(cls, X) TFE_2(WHAT, cls, __VA_ARGS__)
#define TFE_4(WHAT, cls, X, ...) WHAT(cls, X) TFE_3(WHAT, cls, __VA_ARGS__)
#define TFE_5(WHAT, cls, X, ...) WHAT(cls, X) TFE_4(WHAT, cls, __VA_ARGS__)
#define TFE_6(WHAT, cls, X, ...) WHAT(cls, X) TFE_5(WHAT, cls, __VA_ARGS__)
#define TFE_7(WHAT, cls, X, ...) WHAT(cls, X) TFE_6(WHAT, cls, __VA_ARGS__)
#define TFE_8(WHAT, cls, X, ...) WHAT(cls, X) TFE_7(WHAT, cls, __VA_ARGS__)
#define TFE_9(WHAT, cls, X, ...) WHAT(cls, X) TFE_8(WHAT, cls, __VA_ARGS__)
#define TFE_10(WHAT, cls, X, ...) WHAT(cls, X) TFE_9(WHAT, cls, __VA_ARGS__)
#define TFE_11(WHAT, cls, X, ...) WHAT(cls, X) TFE_10(WHAT, cls, __VA_ARGS__)
#define TFE_12(WHAT, cls, X, ...) WHAT(cls, X) TFE_11(WHAT, cls, __VA_ARGS__)
#define TFE_13(WHAT, cls, X, ...) WHAT(cls, X) TFE_12(WHAT, cls, __VA_ARGS__)
#define TFE_14(WHAT, cls, X, ...) WHAT(cls, X) TFE_13(WHAT, cls, __VA_ARGS__)
#define TFE_15(WHAT, cls, X, ...) WHAT(cls, X) TFE_14(WHAT, cls, __VA_ARGS__)
#define TFE_16(WHAT, cls, X, ...) WHAT(cls, X) TFE_15(WHAT, cls, __VA_ARGS__)

#define T_GET_MACRO(_0, _1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, NAME, ...) NAME

#define T_FOR_EACH(action, cls, ...) \
    T_GET_MACRO(_0, __VA_ARGS__, \
        TFE_16, TFE_15, TFE_14, TFE_13, TFE_12, TFE_11, TFE_10, TFE_9, \
        TFE_8, TFE_7, TFE_6, TFE_5, TFE_4, TFE_3, TFE_2, TFE_1, TFE_0)(action, cls, __VA_ARGS__)

// Individual action macros (each includes its own terminator)
#define TRELLIS_COLUMN_DEF(cls, field) \
    columns.push_back({#field, ::trellis::table_field<decltype(cls::field)>::column});

#define TRELLIS_READ_FIELD(cls, field) \
    record.field = conn.get_field_in_table_row<decltype(cls::field)>(table, id, #field);

#define TRELLIS_COLLECT_VALUE(cls, field) \
    result.emplace_back(#field, ::trellis::table_field<decltype(cls::field)>::to_column_value(record.field));

#define TRELLIS_DISPLAY_VALUE(cls, field) \
    result.push_back(::trellis::table_field<decltype(cls::field)>::to_display_string(record.field));

#define TRELLIS_FIELD_DISPLAY(cls, field) \
    result.push_back(::trellis::detail::field_display_string<decltype(cls::field)>(conn, table, id, #field));

// Main table registration macro
#define TRELLIS_TABLE(cls, ...) \
    template<> \
    struct trellis::table_row<cls> { \
        using record_type = cls; \
        \
        /* Column list, built once */ \
        static const std::vector<::trellis::column_def>& fields() { \
            static const std::vector<::trellis::column_def> cached = [] { \
                std::vector<::trellis::column_def> columns; \
                T_FOR_EACH(TRELLIS_COLUMN_DEF, cls, __VA_ARGS__) \
                return columns; \
            }(); \
            return cached; \
        } \
        \
        static std::vector<std::string> field_names() { \
            std::vector<std::string> names; \
            for (const auto& column : fields()) names.push_back(column.name); \
            return names; \
        } \
        \
        static ::trellis::table_schema schema(const std::string& table) { \
            return ::trellis::table_schema{table, fields()}; \
        } \
        \
        static void setup(::trellis::database& db, const std::string& table) { \
            db.ensure_table(schema(table)); \
        } \
        \
        /* Reads every field; throws db_error if one is missing or mistyped */ \
        static cls from_table_row(const ::trellis::db_connection& conn, \
                                  const std::string& table, ::trellis::row_id id) { \
            cls record{}; \
            T_FOR_EACH(TRELLIS_READ_FIELD, cls, __VA_ARGS__) \
            return record; \
        } \
        \
        static std::vector<std::pair<std::string, ::trellis::column_value_t>> to_values(const cls& record) { \
            std::vector<std::pair<std::string, ::trellis::column_value_t>> result; \
            T_FOR_EACH(TRELLIS_COLLECT_VALUE, cls, __VA_ARGS__) \
            return result; \
        } \
        \
        static std::vector<std::string> to_display_strings(const cls& record) { \
            std::vector<std::string> result; \
            T_FOR_EACH(TRELLIS_DISPLAY_VALUE, cls, __VA_ARGS__) \
            return result; \
        } \
        \
        static void push_tabled_header(::trellis::table_builder& builder) { \
            std::vector<std::string> header{"ID"}; \
            for (const auto& column : fields()) header.push_back(column.name); \
            builder.push_record(std::move(header)); \
        } \
        \
        /* A row that fails to load is listed as [id, "Err"] */ \
        static void push_tabled_record(::trellis::table_builder& builder, \
                                       const ::trellis::db_connection& conn, \
                                       const std::string& table, ::trellis::row_id id) { \
            std::vector<std::string> cells{id.to_string()}; \
            try { \
                auto values = to_display_strings(from_table_row(conn, table, id)); \
                cells.insert(cells.end(), values.begin(), values.end()); \
            } catch (const ::trellis::db_error&) { \
                cells.push_back("Err"); \
            } \
            builder.push_record(std::move(cells)); \
        } \
        \
        /* Per-field display strings; a field that fails to load is empty */ \
        static std::vector<std::string> fields_as_strings(const ::trellis::db_connection& conn, \
                                                          const std::string& table, ::trellis::row_id id) { \
            std::vector<std::string> result; \
            T_FOR_EACH(TRELLIS_FIELD_DISPLAY, cls, __VA_ARGS__) \
            return result; \
        } \
    };
