#pragma once

#include "command.hpp"
#include "config.hpp"
#include "db_connection.hpp"
#include "error.hpp"
#include "resources.hpp"
#include "schema.hpp"
#include "table_config.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace trellis {

class context;

/// A registration unit. build() runs once, when the plugin is added, and may
/// register commands, tables and resources. A plugin that depends on a
/// resource added by an earlier plugin should fetch it with
/// context::require_resource so a wrong order fails loudly.
class plugin {
public:
    virtual ~plugin() = default;
    virtual void build(context& ctx) = 0;
};

// ============================================================================
// context
//
// The application state. Lifecycle:
//   1. construction
//   2. registration: add_plugin / add_command / add_table / add_resource
//   3. startup(): opens the connection and runs every table setup
//   4. execution: execute(command) any number of times
// ============================================================================

class context {
public:
    context() = default;

    // Non-copyable
    context(const context&) = delete;
    context& operator=(const context&) = delete;

    // MARK: - Registration

    /// Builds the plugin immediately, in call order.
    template<typename P, typename... Args>
    context& add_plugin(Args&&... args) {
        static_assert(std::is_base_of_v<plugin, P>, "P must derive from trellis::plugin");
        return add_plugin(std::make_unique<P>(std::forward<Args>(args)...));
    }

    context& add_plugin(std::unique_ptr<plugin> p);

    context& add_command(command_def def, command_handler handler);

    /// Registers the table generated for `Row` by TRELLIS_TABLE under `name`.
    template<typename Row>
    context& add_table(std::string name) {
        return add_table(make_table_config<Row>(std::move(name)));
    }

    /// Throws configuration_error on a duplicate table name or after startup.
    context& add_table(table_config config);

    const std::vector<table_config>& tables() const { return tables_; }

    /// Use an in-memory database at startup instead of a file.
    context& in_memory_db(bool in_memory);

    /// Installs a configuration and applies its log level.
    context& configure(configuration config);
    const configuration& config() const { return config_; }

    // MARK: - Lifecycle

    /// Opens the connection, runs every table setup and stores the
    /// db_connection as a resource. May be called once.
    void startup();
    bool started() const { return started_; }

    /// Routes one command line to its handler.
    command_response execute(const std::string& command);
    command_response execute(int argc, const char* const* argv);

    const command_router& router() const { return router_; }

    // MARK: - Resources

    template<typename R>
    R& add_resource(R&& res) {
        return resources_.add(std::forward<R>(res));
    }

    template<typename R, typename... Args>
    R& emplace_resource(Args&&... args) {
        return resources_.emplace<R>(std::forward<Args>(args)...);
    }

    template<typename R>
    R* get_resource() { return resources_.get<R>(); }

    template<typename R>
    const R* get_resource() const { return resources_.get<R>(); }

    template<typename R>
    bool has_resource() const { return resources_.has<R>(); }

    /// Returns the resource, or throws configuration_error naming `what`.
    template<typename R>
    R& require_resource(const char* what) {
        if (auto* r = resources_.get<R>()) {
            return *r;
        }
        throw configuration_error(std::string("required resource missing: ") + what);
    }

    resource_registry& resources() { return resources_; }

    /// The open connection. Throws no_connection_error before startup or
    /// after the database was deleted.
    db_connection& connection();
    const db_connection& connection() const;

private:
    std::vector<std::unique_ptr<plugin>> plugins_;
    command_router router_;
    std::vector<table_config> tables_;
    configuration config_;
    resource_registry resources_;
    bool started_ = false;
};

} // namespace trellis
