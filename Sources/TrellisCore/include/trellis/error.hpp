#pragma once

#include <stdexcept>
#include <string>

namespace trellis {

enum class error_kind {
    no_connection,
    file,
    database,
    command,
    configuration
};

const char* to_string(error_kind kind);

/// Base class of every exception the framework throws.
class error : public std::runtime_error {
public:
    error(error_kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

/// A row or connection operation ran before startup or after the database was deleted.
class no_connection_error : public error {
public:
    no_connection_error() : error(error_kind::no_connection, "no active database connection") {}
};

class file_error : public error {
public:
    explicit file_error(const std::string& msg) : error(error_kind::file, msg) {}
};

class db_error : public error {
public:
    explicit db_error(const std::string& msg) : error(error_kind::database, msg) {}
};

/// Unknown command, unrecognized subcommand or bad arguments.
class command_error : public error {
public:
    explicit command_error(const std::string& msg) : error(error_kind::command, msg) {}
};

class configuration_error : public error {
public:
    explicit configuration_error(const std::string& msg) : error(error_kind::configuration, msg) {}
};

/// Debug form of an error, e.g. DatabaseError("no such table: foo").
std::string describe(const error& e);

} // namespace trellis
