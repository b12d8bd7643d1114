#include "trellis/error.hpp"

namespace trellis {

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::no_connection: return "NoConnectionError";
        case error_kind::file: return "FileError";
        case error_kind::database: return "DatabaseError";
        case error_kind::command: return "CommandError";
        case error_kind::configuration: return "ConfigurationError";
    }
    return "Error";
}

std::string describe(const error& e) {
    if (e.kind() == error_kind::no_connection) {
        return to_string(e.kind());
    }

    std::string result = to_string(e.kind());
    result += "(\"";
    for (const char* c = e.what(); *c; ++c) {
        if (*c == '"' || *c == '\\') result += '\\';
        result += *c;
    }
    result += "\")";
    return result;
}

} // namespace trellis
