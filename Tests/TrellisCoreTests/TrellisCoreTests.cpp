#include <Trellis.hpp>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

// ============================================================================
// Model Definitions
// ============================================================================

struct note {
    std::string title;
    int64_t count;
    bool done;
    double score;
    std::optional<std::string> tag;
    std::vector<trellis::row_id> links;
};
TRELLIS_TABLE(note, title, count, done, score, tag, links)

struct label {
    std::string name;
};
TRELLIS_TABLE(label, name)

namespace {

struct counter {
    int value = 0;
};

struct greeting {
    std::string text;
};

// Adds a counter resource
struct counter_plugin : trellis::plugin {
    void build(trellis::context& ctx) override {
        ctx.add_resource(counter{10});
    }
};

// Needs the counter resource from counter_plugin
struct counter_commands_plugin : trellis::plugin {
    void build(trellis::context& ctx) override {
        ctx.require_resource<counter>("counter (add counter_plugin first)");
        ctx.add_command(
            trellis::command_def("bump", "Increments the counter")
                .arg(trellis::arg_def::integer("by", "Amount to add"))
                .arg(trellis::arg_def::flag("quiet", "Print nothing")),
            [](trellis::context& c, const trellis::arg_matches& m) {
                auto& cnt = *c.get_resource<counter>();
                cnt.value += m.value("by") ? static_cast<int>(m.get_integer("by")) : 1;
                if (m.flag("quiet")) {
                    return trellis::command_response::none();
                }
                return trellis::command_response::message("counter: " + std::to_string(cnt.value));
            });
    }
};

struct notes_plugin : trellis::plugin {
    void build(trellis::context& ctx) override {
        ctx.add_table<note>("note");
        ctx.add_table<label>("label");
    }
};

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("trellis_core_tests_" + name);
}

void remove_db_files(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path.string() + "-wal", ec);
    std::filesystem::remove(path.string() + "-shm", ec);
}

} // namespace

// ============================================================================
// Test: Resource Registry
// ============================================================================

void test_resource_registry() {
    std::cout << "Testing resource registry..." << std::endl;

    trellis::resource_registry resources;
    assert(resources.empty());
    assert(resources.get<counter>() == nullptr);

    resources.add(counter{3});
    assert(resources.has<counter>());
    assert(resources.get<counter>()->value == 3);

    // Mutation through the returned pointer is visible to later lookups
    resources.get<counter>()->value += 1;
    assert(resources.get<counter>()->value == 4);

    // Adding again replaces
    resources.add(counter{7});
    assert(resources.size() == 1);
    assert(resources.get<counter>()->value == 7);

    // Distinct types are independent
    resources.emplace<greeting>(greeting{"hello"});
    assert(resources.size() == 2);
    assert(resources.get<greeting>()->text == "hello");
    assert(resources.get<counter>()->value == 7);

    // get_or_add default-constructs once
    auto& fresh = resources.get_or_add<std::vector<int>>();
    fresh.push_back(1);
    assert(resources.get_or_add<std::vector<int>>().size() == 1);

    assert(resources.remove<counter>());
    assert(!resources.remove<counter>());
    assert(resources.get<counter>() == nullptr);

    const trellis::resource_registry& view = resources;
    assert(view.get<greeting>() != nullptr);
    assert(view.get<counter>() == nullptr);

    std::cout << "  Resource registry test passed!" << std::endl;
}

// ============================================================================
// Test: Field Marshalling
// ============================================================================

void test_field_marshalling() {
    std::cout << "Testing field marshalling..." << std::endl;

    using trellis::column_value_t;
    using trellis::row_id;
    using trellis::table_field;

    // row id lists
    using id_list = std::vector<row_id>;
    assert(table_field<id_list>::from_column_value(column_value_t(std::string())).empty());
    auto ids = table_field<id_list>::from_column_value(column_value_t(std::string("1,2,3")));
    assert(ids.size() == 3);
    assert(ids[0] == row_id(1) && ids[2] == row_id(3));
    assert(table_field<id_list>::to_display_string(ids) == "1,2,3");

    bool threw = false;
    try {
        table_field<id_list>::from_column_value(column_value_t(std::string("1,x")));
    } catch (const trellis::db_error&) {
        threw = true;
    }
    assert(threw);

    // NULL in a required field is an error, in an optional field it is absent
    threw = false;
    try {
        table_field<std::string>::from_column_value(column_value_t(nullptr));
    } catch (const trellis::db_error& e) {
        threw = true;
        assert(std::string(e.what()) == "Invalid column type Null, expected Text");
    }
    assert(threw);
    assert(!table_field<std::optional<std::string>>::from_column_value(column_value_t(nullptr)));

    // Unparsable optional values read as absent
    assert(!table_field<std::optional<row_id>>::from_column_value(column_value_t(std::string("abc"))));
    auto present = table_field<std::optional<row_id>>::from_column_value(column_value_t(int64_t(5)));
    assert(present && *present == row_id(5));

    // Integers stored as numeric text
    assert(table_field<int64_t>::from_column_value(column_value_t(std::string("42"))) == 42);
    assert(table_field<bool>::from_column_value(column_value_t(int64_t(1))));

    assert(trellis::detail::parse_integer("-17") == int64_t(-17));
    assert(!trellis::detail::parse_integer("12a"));
    assert(!trellis::detail::parse_integer(""));
    assert(!trellis::detail::parse_integer(" 7"));
    assert(!trellis::detail::parse_integer("\t7"));

    // Whitespace inside an id list is not a valid id
    threw = false;
    try {
        table_field<id_list>::from_column_value(column_value_t(std::string(" 7, +8")));
    } catch (const trellis::db_error&) {
        threw = true;
    }
    assert(threw);

    // int fields reject stored values that do not fit
    assert(table_field<int>::from_column_value(column_value_t(int64_t(-42))) == -42);
    threw = false;
    try {
        table_field<int>::from_column_value(column_value_t((int64_t(1) << 33) | 5));
    } catch (const trellis::db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Field marshalling test passed!" << std::endl;
}

// ============================================================================
// Test: Table Builder
// ============================================================================

void test_table_builder() {
    std::cout << "Testing table builder..." << std::endl;

    trellis::table_builder builder;
    assert(builder.build().empty());

    builder.push_record({"ID", "name"});
    builder.push_record({"1", "Ann"});
    builder.push_record({"12"});

    const std::string expected =
        "+----+------+\n"
        "| ID | name |\n"
        "+----+------+\n"
        "| 1  | Ann  |\n"
        "| 12 |      |\n"
        "+----+------+";
    assert(builder.build() == expected);

    std::cout << "  Table builder test passed!" << std::endl;
}

// ============================================================================
// Test: Row Operations
// ============================================================================

void test_row_operations() {
    std::cout << "Testing row operations..." << std::endl;

    trellis::context ctx;
    ctx.in_memory_db(true);
    ctx.add_plugin<notes_plugin>();
    ctx.startup();

    auto& conn = ctx.connection();
    assert(!conn.db_path());
    assert(conn.find_table("note") != nullptr);
    assert(conn.find_table("missing") == nullptr);

    trellis::row_id first = conn.new_row_in_table("note");
    assert(first == trellis::row_id(1));
    trellis::row_id second = conn.new_row_in_table("note");
    assert(second == trellis::row_id(2));

    conn.set_field_in_table("note", first, "title", std::string("groceries"));
    conn.set_field_in_table("note", first, "count", int64_t(3));
    assert(conn.get_field_in_table_row<std::string>("note", first, "title") == "groceries");
    assert(conn.get_field_in_table_row<int64_t>("note", first, "count") == 3);

    // Unset optional reads absent; unset required field is an error
    assert(!conn.get_field_in_table_row<std::optional<std::string>>("note", first, "tag"));
    bool threw = false;
    try {
        conn.get_field_in_table_row<std::string>("note", second, "title");
    } catch (const trellis::db_error&) {
        threw = true;
    }
    assert(threw);

    // Reading a wide integer as int fails instead of wrapping
    conn.set_field_in_table("note", first, "count", (int64_t(1) << 33) | 5);
    threw = false;
    try {
        conn.get_field_in_table_row<int>("note", first, "count");
    } catch (const trellis::db_error&) {
        threw = true;
    }
    assert(threw);
    assert(conn.get_field_in_table_row<int64_t>("note", first, "count") == ((int64_t(1) << 33) | 5));

    // Missing column reads absent for optionals
    assert(!conn.get_field_in_table_row<std::optional<std::string>>("note", first, "no_such_column"));

    // Removal, including a row that does not exist
    conn.remove_row_in_table("note", first);
    conn.remove_row_in_table("note", trellis::row_id(99));
    auto ids = conn.get_table_row_ids("note");
    assert(ids.size() == 1 && ids[0] == second);

    // Ids are not reused after removal
    assert(conn.new_row_in_table("note") == trellis::row_id(3));

    // Unknown table
    threw = false;
    try {
        conn.new_row_in_table("nope");
    } catch (const trellis::db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Row operations test passed!" << std::endl;
}

// ============================================================================
// Test: Generated Row Mapping
// ============================================================================

void test_generated_rows() {
    std::cout << "Testing generated row mapping..." << std::endl;

    const auto& fields = trellis::table_row<note>::fields();
    assert(fields.size() == 6);
    assert(fields[0].name == "title" && fields[0].type == trellis::column_type::text);
    assert(fields[1].type == trellis::column_type::integer);
    assert(fields[3].type == trellis::column_type::real);
    assert(fields[5].name == "links" && fields[5].type == trellis::column_type::text);
    assert(&trellis::table_row<note>::fields() == &fields);

    trellis::context ctx;
    ctx.in_memory_db(true);
    ctx.add_plugin<notes_plugin>();
    ctx.startup();
    auto& conn = ctx.connection();

    note n{"walk", 2, true, 1.5, std::nullopt, {trellis::row_id(4), trellis::row_id(9)}};
    trellis::row_id id = conn.insert_row("note", n);

    note loaded = conn.get_row<note>("note", id);
    assert(loaded.title == "walk");
    assert(loaded.count == 2);
    assert(loaded.done);
    assert(loaded.score == 1.5);
    assert(!loaded.tag);
    assert(loaded.links.size() == 2 && loaded.links[1] == trellis::row_id(9));

    loaded.tag = "outdoor";
    loaded.links.clear();
    conn.update_row("note", id, loaded);
    note updated = conn.get_row<note>("note", id);
    assert(updated.tag && *updated.tag == "outdoor");
    assert(updated.links.empty());

    // Listing: a row with an unset required field shows as Err
    trellis::row_id blank = conn.new_row_in_table("label");
    const trellis::table_config* config = conn.find_table("label");
    trellis::table_builder builder;
    config->push_tabled_header(builder);
    config->push_tabled_record(builder, conn, "label", blank);
    assert(builder.rows()[0] == std::vector<std::string>({"ID", "name"}));
    assert(builder.rows()[1] == std::vector<std::string>({"1", "Err"}));

    auto strings = config->fields_as_strings(conn, "label", blank);
    assert(strings.size() == 1 && strings[0].empty());

    std::cout << "  Generated row mapping test passed!" << std::endl;
}

// ============================================================================
// Test: Command Router
// ============================================================================

void test_command_router() {
    std::cout << "Testing command router..." << std::endl;

    trellis::context ctx;
    ctx.in_memory_db(true);
    ctx.add_plugin<counter_plugin>();
    ctx.add_plugin<counter_commands_plugin>();
    ctx.add_command(
        trellis::command_def("echo", "Echoes text").alias("say")
            .arg(trellis::arg_def::text("text", "Text to echo").require()),
        [](trellis::context&, const trellis::arg_matches& m) {
            return trellis::command_response::message(m.get_string("text"));
        });
    ctx.add_command(
        trellis::command_def("group", "Nested commands")
            .subcommand(trellis::command_def("inner", "Inner command")
                .arg(trellis::arg_def::text("name", "A name").require()))
            .require_subcommand(),
        [](trellis::context&, const trellis::arg_matches& m) {
            assert(m.subcommand() != nullptr);
            return trellis::command_response::message(m.subcommand_name() + ":" + m.subcommand()->get_string("name"));
        });
    ctx.startup();

    assert(ctx.router().has_command("say"));
    assert(!ctx.router().has_command("shout"));

    auto r = ctx.execute("bump");
    assert(r.text && *r.text == "counter: 11");
    r = ctx.execute("bump --by 5");
    assert(r.text && *r.text == "counter: 16");
    r = ctx.execute("bump --quiet");
    assert(!r.text);
    assert(ctx.get_resource<counter>()->value == 17);

    r = ctx.execute("say --text \"hello world\"");
    assert(r.text && *r.text == "hello world");

    r = ctx.execute("group inner --name x");
    assert(r.text && *r.text == "inner:x");

    const char* argv[] = {"trellis", "echo", "--text", "two words"};
    r = ctx.execute(4, argv);
    assert(r.text && *r.text == "two words");

    // Help and version are responses, not errors
    r = ctx.execute("--help");
    assert(r.text && r.text->find("echo") != std::string::npos);
    r = ctx.execute("--version");
    assert(r.text && r.text->find("trellis") != std::string::npos);

    auto command_error_message = [&](const std::string& line) {
        try {
            ctx.execute(line);
        } catch (const trellis::command_error& e) {
            return std::string(e.what());
        }
        assert(false && "expected a command_error");
        return std::string();
    };
    assert(command_error_message("frobnicate") == "unknown command: frobnicate");
    assert(command_error_message("frobnicate --text x") == "unknown command: frobnicate");
    assert(command_error_message("group outer --name x") == "subcommand not recognized: outer");
    assert(!command_error_message("echo").empty());
    assert(!command_error_message("bump --by lots").empty());
    assert(!command_error_message("group").empty());
    assert(!command_error_message("").empty());

    // A misspelled option is not mistaken for a subcommand
    auto misspelled = command_error_message("echo --txet=hi");
    assert(misspelled.find("subcommand not recognized") == std::string::npos);
    assert(misspelled.find("unknown command") == std::string::npos);

    // Duplicate names and aliases
    bool threw = false;
    try {
        ctx.add_command(trellis::command_def("say", "Clashes with an alias"),
                        [](trellis::context&, const trellis::arg_matches&) {
                            return trellis::command_response::none();
                        });
    } catch (const trellis::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Command router test passed!" << std::endl;
}

// ============================================================================
// Test: Context Lifecycle
// ============================================================================

void test_context_lifecycle() {
    std::cout << "Testing context lifecycle..." << std::endl;

    // Plugin order: the dependent plugin fails loudly when added first
    {
        trellis::context ctx;
        bool threw = false;
        try {
            ctx.add_plugin<counter_commands_plugin>();
        } catch (const trellis::configuration_error& e) {
            threw = true;
            assert(std::string(e.what()).find("counter") != std::string::npos);
        }
        assert(threw);
    }

    trellis::context ctx;
    ctx.in_memory_db(true);

    // No connection before startup
    bool threw = false;
    try {
        ctx.connection();
    } catch (const trellis::no_connection_error&) {
        threw = true;
    }
    assert(threw);

    ctx.add_plugin<notes_plugin>();

    threw = false;
    try {
        ctx.add_table<label>("label");
    } catch (const trellis::configuration_error&) {
        threw = true;
    }
    assert(threw);

    ctx.startup();
    assert(ctx.started());
    assert(ctx.has_resource<trellis::db_connection>());

    threw = false;
    try {
        ctx.startup();
    } catch (const trellis::configuration_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ctx.add_table<label>("other");
    } catch (const trellis::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Context lifecycle test passed!" << std::endl;
}

// ============================================================================
// Test: Database Deletion
// ============================================================================

void test_delete_db() {
    std::cout << "Testing database deletion..." << std::endl;

    // In-memory: closed, then every operation reports no connection
    {
        trellis::context ctx;
        ctx.in_memory_db(true);
        ctx.add_plugin<notes_plugin>();
        ctx.startup();

        ctx.connection().delete_db();
        auto* conn = ctx.get_resource<trellis::db_connection>();
        assert(conn && !conn->is_open());

        bool threw = false;
        try {
            conn->new_row_in_table("note");
        } catch (const trellis::no_connection_error& e) {
            threw = true;
            assert(trellis::describe(e) == "NoConnectionError");
        }
        assert(threw);

        threw = false;
        try {
            ctx.connection();
        } catch (const trellis::no_connection_error&) {
            threw = true;
        }
        assert(threw);
    }

    // File: the file is removed
    {
        auto path = temp_path("delete.db");
        remove_db_files(path);

        trellis::configuration config;
        config.db_path = path.string();
        trellis::context ctx;
        ctx.configure(config);
        ctx.add_plugin<notes_plugin>();
        ctx.startup();
        ctx.connection().new_row_in_table("note");
        assert(ctx.connection().db_path() && *ctx.connection().db_path() == path);
        assert(std::filesystem::exists(path));

        ctx.connection().delete_db();
        assert(!std::filesystem::exists(path));
    }

    std::cout << "  Database deletion test passed!" << std::endl;
}

// ============================================================================
// Test: Configuration
// ============================================================================

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    // Missing file gives defaults
    auto missing = temp_path("missing.json");
    std::filesystem::remove(missing);
    auto defaults = trellis::configuration::load(missing);
    assert(defaults.app_name == "trellis");
    assert(!defaults.db_path);
    assert(!defaults.in_memory);
    assert(defaults.level == trellis::log_level::warn);

    auto path = temp_path("config.json");
    {
        std::ofstream out(path);
        out << R"({ "app_name": "gym", "db_path": "/tmp/gym.db", "in_memory": true, "log_level": "debug" })";
    }
    auto loaded = trellis::configuration::load(path);
    assert(loaded.app_name == "gym");
    assert(loaded.db_path && *loaded.db_path == "/tmp/gym.db");
    assert(loaded.in_memory);
    assert(loaded.level == trellis::log_level::debug);

    auto reparsed_path = temp_path("config_roundtrip.json");
    {
        std::ofstream out(reparsed_path);
        out << loaded.to_json_string();
    }
    auto reparsed = trellis::configuration::load(reparsed_path);
    assert(reparsed.app_name == "gym" && reparsed.in_memory);

    auto expect_config_error = [&](const std::string& text) {
        {
            std::ofstream out(path);
            out << text;
        }
        bool threw = false;
        try {
            trellis::configuration::load(path);
        } catch (const trellis::configuration_error&) {
            threw = true;
        }
        assert(threw);
    };
    expect_config_error("{ not json");
    expect_config_error("[1, 2]");
    expect_config_error(R"({ "log_level": "loud" })");

    // Environment overrides
    setenv("TRELLIS_DB_PATH", "/tmp/env.db", 1);
    setenv("TRELLIS_LOG_LEVEL", "error", 1);
    trellis::configuration env;
    env.apply_environment();
    assert(env.db_path && *env.db_path == "/tmp/env.db");
    assert(env.level == trellis::log_level::error);

    setenv("TRELLIS_LOG_LEVEL", "chatty", 1);
    bool threw = false;
    try {
        env.apply_environment();
    } catch (const trellis::configuration_error&) {
        threw = true;
    }
    assert(threw);
    unsetenv("TRELLIS_DB_PATH");
    unsetenv("TRELLIS_LOG_LEVEL");

    // configure() applies the level
    {
        trellis::scoped_log_level restore(trellis::get_log_level());
        trellis::configuration quiet;
        quiet.level = trellis::log_level::off;
        trellis::context ctx;
        ctx.configure(quiet);
        assert(trellis::get_log_level() == trellis::log_level::off);
    }

    std::filesystem::remove(path);
    std::filesystem::remove(reparsed_path);

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Test: Error Descriptions
// ============================================================================

void test_error_descriptions() {
    std::cout << "Testing error descriptions..." << std::endl;

    assert(trellis::describe(trellis::db_error("no such table: foo")) == "DatabaseError(\"no such table: foo\")");
    assert(trellis::describe(trellis::file_error("say \"hi\"")) == "FileError(\"say \\\"hi\\\"\")");
    assert(trellis::describe(trellis::command_error("x")) == "CommandError(\"x\")");
    assert(trellis::describe(trellis::configuration_error("y")) == "ConfigurationError(\"y\")");

    trellis::db_error e("z");
    assert(e.kind() == trellis::error_kind::database);

    std::cout << "  Error descriptions test passed!" << std::endl;
}

int main() {
    std::cout << "=== TrellisCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_resource_registry();
        test_field_marshalling();
        test_table_builder();

        // Database tests
        test_row_operations();
        test_generated_rows();
        test_delete_db();

        // Composition tests
        test_command_router();
        test_context_lifecycle();
        test_configuration();
        test_error_descriptions();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (10 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
