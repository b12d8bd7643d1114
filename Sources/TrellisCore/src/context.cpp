#include "trellis/context.hpp"
#include "trellis/log.hpp"

namespace trellis {

context& context::add_plugin(std::unique_ptr<plugin> p) {
    LOG_DEBUG("context", "Building plugin %zu", plugins_.size());
    plugins_.push_back(std::move(p));
    plugins_.back()->build(*this);
    return *this;
}

context& context::add_command(command_def def, command_handler handler) {
    router_.add(std::move(def), std::move(handler));
    return *this;
}

context& context::add_table(table_config config) {
    if (started_) {
        throw configuration_error("cannot add table " + config.table_name + " after startup");
    }
    for (const auto& existing : tables_) {
        if (existing.table_name == config.table_name) {
            throw configuration_error("table already registered: " + config.table_name);
        }
    }
    LOG_DEBUG("context", "Registered table %s", config.table_name.c_str());
    tables_.push_back(std::move(config));
    return *this;
}

context& context::in_memory_db(bool in_memory) {
    config_.in_memory = in_memory;
    return *this;
}

context& context::configure(configuration config) {
    if (started_) {
        throw configuration_error("cannot configure after startup");
    }
    config_ = std::move(config);
    set_log_level(config_.level);
    return *this;
}

void context::startup() {
    if (started_) {
        throw configuration_error("context already started");
    }

    if (config_.in_memory) {
        resources_.add(db_connection::open_in_memory(tables_));
    } else {
        std::filesystem::path path = config_.db_path
            ? std::filesystem::path(*config_.db_path)
            : db_connection::default_db_path(config_.app_name);
        resources_.add(db_connection::open_from_path(path, tables_));
    }

    started_ = true;
    LOG_INFO("context", "Started with %zu tables", tables_.size());
}

command_response context::execute(const std::string& command) {
    return router_.execute(*this, command);
}

command_response context::execute(int argc, const char* const* argv) {
    return router_.execute(*this, argc, argv);
}

db_connection& context::connection() {
    auto* conn = resources_.get<db_connection>();
    if (!conn || !conn->is_open()) {
        throw no_connection_error();
    }
    return *conn;
}

const db_connection& context::connection() const {
    auto* conn = resources_.get<db_connection>();
    if (!conn || !conn->is_open()) {
        throw no_connection_error();
    }
    return *conn;
}

} // namespace trellis
