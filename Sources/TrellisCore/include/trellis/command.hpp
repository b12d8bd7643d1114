#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

class context;

// ============================================================================
// Command definitions
//
// A command tree is described with command_def / arg_def builders and handed
// to the router together with a handler. All arguments are long options:
//
//   command_def("set", "Set a field of a row")
//       .arg(arg_def::text("table", "Table name").require())
//       .arg(arg_def::integer("row-id", "Row id").require());
// ============================================================================

struct arg_def {
    enum class value_kind { text, integer, flag };

    std::string name;        // long option name without dashes
    std::string help;
    bool required = false;
    value_kind kind = value_kind::text;

    static arg_def text(std::string name, std::string help);
    static arg_def integer(std::string name, std::string help);
    static arg_def flag(std::string name, std::string help);

    arg_def& require() {
        required = true;
        return *this;
    }
};

class command_def {
public:
    explicit command_def(std::string name, std::string about = {});

    command_def& alias(std::string name);
    command_def& arg(arg_def def);
    command_def& subcommand(command_def def);
    command_def& require_subcommand();

    const std::string& name() const { return name_; }
    const std::string& about() const { return about_; }
    const std::vector<std::string>& aliases() const { return aliases_; }
    const std::vector<arg_def>& args() const { return args_; }
    const std::vector<command_def>& subcommands() const { return subcommands_; }
    bool subcommand_required() const { return subcommand_required_; }

    /// True if `name` is this command's name or one of its aliases.
    bool answers_to(const std::string& name) const;

private:
    std::string name_;
    std::string about_;
    std::vector<std::string> aliases_;
    std::vector<arg_def> args_;
    std::vector<command_def> subcommands_;
    bool subcommand_required_ = false;
};

// ============================================================================
// Parsed arguments
// ============================================================================

/// Snapshot of the arguments matched for one command level.
class arg_matches {
public:
    arg_matches() = default;

    /// Raw value of an option, or nullptr if it was not given.
    const std::string* value(const std::string& name) const;

    /// Value of an option. Throws command_error if it was not given.
    std::string get_string(const std::string& name) const;

    /// Value of an integer option. Throws command_error if absent or not an integer.
    int64_t get_integer(const std::string& name) const;

    bool flag(const std::string& name) const { return flag_count(name) > 0; }
    size_t flag_count(const std::string& name) const;

    /// Name (as registered, not the alias typed) of the matched subcommand, or "" if none.
    const std::string& subcommand_name() const { return subcommand_name_; }

    /// Matches of the subcommand, or nullptr if none was given.
    const arg_matches* subcommand() const { return subcommand_.get(); }

    // Filled in by the router
    void set_value(const std::string& name, std::string value) { values_[name] = std::move(value); }
    void set_flag_count(const std::string& name, size_t count) { flags_[name] = count; }
    void set_subcommand(std::string name, arg_matches matches);

private:
    std::map<std::string, std::string> values_;
    std::map<std::string, size_t> flags_;
    std::string subcommand_name_;
    std::shared_ptr<const arg_matches> subcommand_;
};

// ============================================================================
// Router
// ============================================================================

/// What a handler returns: optional text to show the user.
struct command_response {
    std::optional<std::string> text;

    static command_response none() { return {}; }
    static command_response message(std::string text) { return {std::move(text)}; }
};

/// Handlers report failures by throwing trellis::error subclasses.
using command_handler = std::function<command_response(context&, const arg_matches&)>;

class command_router {
public:
    /// Registers a top-level command. Throws configuration_error if its
    /// name or an alias is already taken.
    void add(command_def def, command_handler handler);

    bool has_command(const std::string& name) const;

    /// Tokenizes `line` with shell-like quoting, parses it against the
    /// registered commands and runs exactly one handler. Handler exceptions
    /// propagate unchanged; parse failures throw command_error.
    command_response execute(context& ctx, const std::string& line) const;

    /// Same as execute(ctx, line) for a process argument vector (argv[0] is skipped).
    command_response execute(context& ctx, int argc, const char* const* argv) const;

private:
    struct entry {
        command_def def;
        command_handler handler;
    };

    std::vector<entry> commands_;
    std::string version_ = "trellis 0.1.0";

    template<typename Parse>
    command_response dispatch(context& ctx, Parse&& parse) const;
};

} // namespace trellis
