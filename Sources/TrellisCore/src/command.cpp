#include "trellis/command.hpp"
#include "trellis/error.hpp"
#include "trellis/log.hpp"
#include "trellis/table_field.hpp"
#include <CLI/CLI.hpp>

namespace trellis {

// ============================================================================
// Definitions
// ============================================================================

arg_def arg_def::text(std::string name, std::string help) {
    return arg_def{std::move(name), std::move(help), false, value_kind::text};
}

arg_def arg_def::integer(std::string name, std::string help) {
    return arg_def{std::move(name), std::move(help), false, value_kind::integer};
}

arg_def arg_def::flag(std::string name, std::string help) {
    return arg_def{std::move(name), std::move(help), false, value_kind::flag};
}

command_def::command_def(std::string name, std::string about)
    : name_(std::move(name)), about_(std::move(about)) {}

command_def& command_def::alias(std::string name) {
    aliases_.push_back(std::move(name));
    return *this;
}

command_def& command_def::arg(arg_def def) {
    args_.push_back(std::move(def));
    return *this;
}

command_def& command_def::subcommand(command_def def) {
    subcommands_.push_back(std::move(def));
    return *this;
}

command_def& command_def::require_subcommand() {
    subcommand_required_ = true;
    return *this;
}

bool command_def::answers_to(const std::string& name) const {
    if (name == name_) return true;
    for (const auto& a : aliases_) {
        if (a == name) return true;
    }
    return false;
}

// ============================================================================
// Matches
// ============================================================================

const std::string* arg_matches::value(const std::string& name) const {
    auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
}

std::string arg_matches::get_string(const std::string& name) const {
    if (auto* v = value(name)) {
        return *v;
    }
    throw command_error("missing required argument --" + name);
}

int64_t arg_matches::get_integer(const std::string& name) const {
    std::string text = get_string(name);
    if (auto parsed = detail::parse_integer(text)) {
        return *parsed;
    }
    throw command_error("invalid integer for --" + name + ": " + text);
}

size_t arg_matches::flag_count(const std::string& name) const {
    auto it = flags_.find(name);
    return it == flags_.end() ? 0 : it->second;
}

void arg_matches::set_subcommand(std::string name, arg_matches matches) {
    subcommand_name_ = std::move(name);
    subcommand_ = std::make_shared<const arg_matches>(std::move(matches));
}

// ============================================================================
// Router
// ============================================================================

namespace {

// A command_def bound to the CLI::App built for it on this parse
struct bound_command {
    const command_def* def = nullptr;
    CLI::App* app = nullptr;
    std::vector<std::pair<const arg_def*, CLI::Option*>> options;
    std::vector<bound_command> subcommands;
};

bound_command bind(CLI::App& parent, const command_def& def) {
    bound_command bound;
    bound.def = &def;
    bound.app = parent.add_subcommand(def.name(), def.about());
    for (const auto& a : def.aliases()) {
        bound.app->alias(a);
    }
    if (def.subcommand_required()) {
        bound.app->require_subcommand(1);
    }

    for (const auto& arg : def.args()) {
        const std::string flag_name = "--" + arg.name;
        CLI::Option* opt = nullptr;
        switch (arg.kind) {
            case arg_def::value_kind::flag:
                opt = bound.app->add_flag(flag_name, arg.help);
                break;
            case arg_def::value_kind::integer:
                opt = bound.app->add_option(flag_name, arg.help)->check(CLI::Number);
                break;
            case arg_def::value_kind::text:
                opt = bound.app->add_option(flag_name, arg.help);
                break;
        }
        if (arg.required) {
            opt->required();
        }
        bound.options.emplace_back(&arg, opt);
    }

    for (const auto& sub : def.subcommands()) {
        bound.subcommands.push_back(bind(*bound.app, sub));
    }
    return bound;
}

arg_matches collect(const bound_command& bound) {
    arg_matches matches;
    for (const auto& [arg, opt] : bound.options) {
        if (arg->kind == arg_def::value_kind::flag) {
            matches.set_flag_count(arg->name, opt->count());
        } else if (opt->count() > 0 && !opt->results().empty()) {
            matches.set_value(arg->name, opt->results().back());
        }
    }
    for (const auto& sub : bound.subcommands) {
        if (sub.app->parsed()) {
            matches.set_subcommand(sub.def->name(), collect(sub));
            break;
        }
    }
    return matches;
}

// Deepest command level that was reached, for level-specific help
const CLI::App* deepest_parsed(const CLI::App& root, const std::vector<bound_command>& commands) {
    for (const auto& cmd : commands) {
        if (cmd.app->parsed()) {
            return deepest_parsed(*cmd.app, cmd.subcommands);
        }
    }
    return &root;
}

} // namespace

void command_router::add(command_def def, command_handler handler) {
    std::vector<std::string> names{def.name()};
    names.insert(names.end(), def.aliases().begin(), def.aliases().end());
    for (const auto& existing : commands_) {
        for (const auto& name : names) {
            if (existing.def.answers_to(name)) {
                throw configuration_error("command already registered: " + name);
            }
        }
    }
    LOG_DEBUG("router", "Registered command %s", def.name().c_str());
    commands_.push_back(entry{std::move(def), std::move(handler)});
}

bool command_router::has_command(const std::string& name) const {
    for (const auto& cmd : commands_) {
        if (cmd.def.answers_to(name)) return true;
    }
    return false;
}

template<typename Parse>
command_response command_router::dispatch(context& ctx, Parse&& parse) const {
    CLI::App app{"Trellis command router", "trellis"};
    app.require_subcommand(1);
    app.set_version_flag("--version", version_);

    std::vector<bound_command> bound;
    bound.reserve(commands_.size());
    for (const auto& cmd : commands_) {
        bound.push_back(bind(app, cmd.def));
    }

    try {
        parse(app);
    } catch (const CLI::CallForHelp&) {
        return command_response::message(deepest_parsed(app, bound)->help());
    } catch (const CLI::CallForAllHelp&) {
        return command_response::message(app.help("", CLI::AppFormatMode::All));
    } catch (const CLI::CallForVersion& e) {
        return command_response::message(e.what());
    } catch (const CLI::ParseError& e) {
        LOG_DEBUG("router", "Parse failed: %s", e.what());
        // A leftover word names a command or subcommand that does not exist;
        // a leftover option is reported by the parser's own message
        auto rest = app.remaining(true);
        if (!rest.empty() && rest.front().rfind("-", 0) != 0) {
            if (deepest_parsed(app, bound) == &app) {
                throw command_error("unknown command: " + rest.front());
            }
            throw command_error("subcommand not recognized: " + rest.front());
        }
        throw command_error(e.what());
    }

    for (size_t i = 0; i < bound.size(); ++i) {
        if (!bound[i].app->parsed()) continue;

        // Copy the handler so a handler registering commands cannot invalidate it mid-call
        command_handler handler = commands_[i].handler;
        arg_matches matches = collect(bound[i]);
        LOG_DEBUG("router", "Dispatching %s", commands_[i].def.name().c_str());
        return handler(ctx, matches);
    }

    throw command_error("unknown command");
}

command_response command_router::execute(context& ctx, const std::string& line) const {
    return dispatch(ctx, [&](CLI::App& app) { app.parse(line, false); });
}

command_response command_router::execute(context& ctx, int argc, const char* const* argv) const {
    return dispatch(ctx, [&](CLI::App& app) { app.parse(argc, argv); });
}

} // namespace trellis
