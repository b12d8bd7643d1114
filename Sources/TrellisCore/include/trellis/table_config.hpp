#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace trellis {

class database;
class db_connection;
class table_builder;

/// Immutable descriptor for one registered table: its name plus the setup
/// and marshalling functions generated for its record type.
struct table_config {
    using setup_fn = void (*)(database&, const std::string& table);
    using push_header_fn = void (*)(table_builder&);
    using push_record_fn = void (*)(table_builder&, const db_connection&, const std::string& table, row_id);
    using columns_fn = const std::vector<column_def>& (*)();
    using field_names_fn = std::vector<std::string> (*)();
    using fields_as_strings_fn = std::vector<std::string> (*)(const db_connection&, const std::string& table, row_id);

    std::string table_name;
    setup_fn setup = nullptr;
    push_header_fn push_tabled_header = nullptr;
    push_record_fn push_tabled_record = nullptr;
    columns_fn columns = nullptr;
    field_names_fn field_names = nullptr;
    fields_as_strings_fn fields_as_strings = nullptr;
};

} // namespace trellis
