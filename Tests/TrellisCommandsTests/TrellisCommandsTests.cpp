#include <Trellis.hpp>
#include <TrellisDbCommands.hpp>
#include <TrellisTraining.hpp>
#include <TrellisTui.hpp>
#include <cassert>
#include <filesystem>
#include <iostream>

using trellis::row_id;
using namespace trellis::tui;

namespace {

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("trellis_commands_tests_" + name);
}

void remove_db_files(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path.string() + "-wal", ec);
    std::filesystem::remove(path.string() + "-shm", ec);
}

// Same plugin order as the trellis executable
void add_plugins(trellis::context& ctx) {
    ctx.add_plugin<tui_plugin>();
    ctx.add_plugin<trellis::training::training_plugin>();
    ctx.add_plugin<trellis::db_commands::db_commands_plugin>();
}

std::string text_of(const trellis::command_response& r) {
    assert(r.text);
    return *r.text;
}

template<typename E>
void expect_error(trellis::context& ctx, const std::string& line) {
    bool threw = false;
    try {
        ctx.execute(line);
    } catch (const E&) {
        threw = true;
    }
    assert(threw);
}

template<typename E>
std::string error_message(trellis::context& ctx, const std::string& line) {
    try {
        ctx.execute(line);
    } catch (const E& e) {
        return e.what();
    }
    assert(false && "expected an error");
    return {};
}

key_event ctrl(char c) {
    return key_event::character(c, key_modifiers::ctrl);
}

void type_text(trellis::context& ctx, const std::string& text) {
    for (char c : text) {
        handle_key_event(ctx, key_event::character(c));
    }
}

} // namespace

// ============================================================================
// Test: Training Tables
// ============================================================================

void test_training_tables() {
    std::cout << "Testing training tables..." << std::endl;

    trellis::context ctx;
    ctx.in_memory_db(true);
    add_plugins(ctx);
    ctx.startup();

    auto& conn = ctx.connection();
    assert(conn.tables().size() == 4);
    assert(conn.find_table("trainer") && conn.find_table("client") &&
           conn.find_table("exercise") && conn.find_table("session"));

    auto names = conn.find_table("trainer")->field_names();
    assert(names == std::vector<std::string>({"name", "company_name", "address", "email", "phone"}));

    trellis::training::client ann{"Ann"};
    row_id client_id = conn.insert_row("client", ann);
    row_id squat = conn.insert_row("exercise", trellis::training::exercise{"Squat"});
    row_id lunge = conn.insert_row("exercise", trellis::training::exercise{"Lunge"});

    trellis::training::training_session s{"2024-03-01", row_id(7), client_id, std::nullopt, {squat, lunge}};
    row_id session_id = conn.insert_row("session", s);

    auto loaded = conn.get_row<trellis::training::training_session>("session", session_id);
    assert(loaded.date == "2024-03-01");
    assert(loaded.trainer == row_id(7));
    assert(loaded.client == client_id);
    assert(!loaded.charge);
    assert(loaded.exercises.size() == 2 && loaded.exercises[1] == lunge);

    auto strings = conn.find_table("session")->fields_as_strings(conn, "session", session_id);
    assert(strings == std::vector<std::string>({"2024-03-01", "7", "1", "", "1,2"}));

    std::cout << "  Training tables test passed!" << std::endl;
}

// ============================================================================
// Test: Row Commands
// ============================================================================

void test_row_commands() {
    std::cout << "Testing row commands..." << std::endl;

    trellis::context ctx;
    ctx.in_memory_db(true);
    add_plugins(ctx);
    ctx.startup();

    assert(text_of(ctx.execute("ls --table client")) == "No entries in table client.");

    assert(text_of(ctx.execute("new --table trainer")) == "Inserted new row (id: 1) in table trainer.");

    const std::string fresh =
        "+----+------+--------------+---------+-------+-------+\n"
        "| ID | name | company_name | address | email | phone |\n"
        "+----+------+--------------+---------+-------+-------+\n"
        "| 1  | Err  |              |         |       |       |\n"
        "+----+------+--------------+---------+-------+-------+";
    assert(text_of(ctx.execute("list --table trainer")) == fresh);

    for (const char* field : {"company_name", "address", "email", "phone"}) {
        auto r = ctx.execute(std::string("set --table trainer --row-id 1 --field ") + field + " --value x");
        assert(!r.text);
    }
    ctx.execute("set --table trainer --row-id 1 --field name --value \"Ann Lee\"");
    const std::string filled =
        "+----+---------+--------------+---------+-------+-------+\n"
        "| ID | name    | company_name | address | email | phone |\n"
        "+----+---------+--------------+---------+-------+-------+\n"
        "| 1  | Ann Lee | x            | x       | x     | x     |\n"
        "+----+---------+--------------+---------+-------+-------+";
    assert(text_of(ctx.execute("list --table trainer")) == filled);

    // Integer-typed fields take their text through column affinity
    ctx.execute("new --table session");
    ctx.execute("set --table session --row-id 1 --field trainer --value 1");
    assert(ctx.connection().get_field_in_table_row<row_id>("session", row_id(1), "trainer") == row_id(1));

    // Removal, including a row that is already gone
    assert(!ctx.execute("rm --table trainer --row-id 1").text);
    assert(!ctx.execute("remove --table trainer --row-id 1").text);
    assert(text_of(ctx.execute("list --table trainer")) == "No entries in table trainer.");

    // Ids are not reused
    assert(text_of(ctx.execute("new --table trainer")) == "Inserted new row (id: 2) in table trainer.");

    expect_error<trellis::command_error>(ctx, "new");
    expect_error<trellis::command_error>(ctx, "set --table trainer --row-id abc --field name --value x");
    assert(error_message<trellis::command_error>(ctx, "explode --table trainer") == "unknown command: explode");
    auto misspelled = error_message<trellis::command_error>(ctx, "new --tabel=trainer");
    assert(misspelled.find("subcommand not recognized") == std::string::npos);
    expect_error<trellis::db_error>(ctx, "new --table nope");
    expect_error<trellis::db_error>(ctx, "list --table nope");
    expect_error<trellis::db_error>(ctx, "set --table trainer --row-id 2 --field shoe_size --value 9");

    auto help = text_of(ctx.execute("list --help"));
    assert(help.find("--table") != std::string::npos);

    std::cout << "  Row commands test passed!" << std::endl;
}

// ============================================================================
// Test: Database Commands
// ============================================================================

void test_db_commands() {
    std::cout << "Testing db commands..." << std::endl;

    // Before startup there is no connection resource at all
    {
        trellis::context ctx;
        add_plugins(ctx);
        bool threw = false;
        try {
            trellis::db_commands::db_info_text(ctx);
        } catch (const trellis::no_connection_error&) {
            threw = true;
        }
        assert(threw);
        expect_error<trellis::no_connection_error>(ctx, "db info");
        expect_error<trellis::no_connection_error>(ctx, "new --table trainer");
    }

    trellis::context ctx;
    ctx.in_memory_db(true);
    add_plugins(ctx);
    ctx.startup();

    assert(text_of(ctx.execute("db info")) ==
           "Database connection open.\nNo database path (in-memory connection)");

    expect_error<trellis::command_error>(ctx, "db");
    assert(error_message<trellis::command_error>(ctx, "db vacuum") == "subcommand not recognized: vacuum");
    expect_error<trellis::command_error>(ctx, "db backup");

    assert(!ctx.execute("db erase").text);
    assert(text_of(ctx.execute("db info")) == "No database connection open.");
    expect_error<trellis::no_connection_error>(ctx, "new --table trainer");
    expect_error<trellis::no_connection_error>(ctx, "db erase");

    std::cout << "  Db commands test passed!" << std::endl;
}

// ============================================================================
// Test: Backup and Restore
// ============================================================================

void test_backup_restore() {
    std::cout << "Testing backup and restore..." << std::endl;

    auto db_path = temp_path("live.db");
    auto backup_path = temp_path("backup.db");
    remove_db_files(db_path);
    remove_db_files(backup_path);

    trellis::configuration config;
    config.db_path = db_path.string();
    trellis::context ctx;
    ctx.configure(config);
    add_plugins(ctx);
    ctx.startup();

    assert(text_of(ctx.execute("db info")) ==
           "Database connection open.\nDatabase path: \"" + db_path.string() + "\"");

    ctx.execute("new --table client");
    ctx.execute("set --table client --row-id 1 --field name --value Ann");

    auto r = ctx.execute("db backup --out-file " + backup_path.string());
    assert(text_of(r) == "Database backed up to \"" + backup_path.string() + "\".");
    assert(std::filesystem::exists(backup_path));

    ctx.execute("rm --table client --row-id 1");
    assert(ctx.connection().get_table_row_ids("client").empty());

    r = ctx.execute("db restore --file " + backup_path.string());
    assert(text_of(r) == "Database restored from \"" + backup_path.string() + "\".");
    assert(ctx.connection().get_field_in_table_row<std::string>("client", row_id(1), "name") == "Ann");

    expect_error<trellis::file_error>(ctx, "db restore --file " + temp_path("missing.db").string());
    expect_error<trellis::file_error>(ctx, "db backup --out-file " + temp_path("no_dir/backup.db").string());

    // A path component longer than NAME_MAX is a file error too
    auto too_long = std::filesystem::temp_directory_path() / std::string(300, 'a') / "backup.db";
    expect_error<trellis::file_error>(ctx, "db backup --out-file " + too_long.string());
    expect_error<trellis::file_error>(ctx, "db restore --file " + too_long.string());
    bool threw = false;
    try {
        ctx.connection().backup(too_long);
    } catch (const trellis::file_error&) {
        threw = true;
    }
    assert(threw);

    // Erasing a file database removes the file
    ctx.execute("db erase");
    assert(!std::filesystem::exists(db_path));

    remove_db_files(backup_path);

    std::cout << "  Backup and restore test passed!" << std::endl;
}

// ============================================================================
// Test: Edit Table Tab
// ============================================================================

void test_edit_table_tab() {
    std::cout << "Testing edit table tab..." << std::endl;

    trellis::context ctx;
    ctx.in_memory_db(true);
    add_plugins(ctx);
    ctx.startup();

    expect_error<trellis::db_error>(ctx, "edit --table nope");

    ctx.execute("new --table trainer");
    assert(text_of(ctx.execute("edit --table trainer")) == "Starting TUI session...");

    auto& sess = *ctx.get_resource<session>();
    assert(sess.tabs().size() == 1);
    tab_id id = sess.selected()->id;
    assert(sess.selected()->impl->title(ctx, id) == "Edit Table: trainer");

    canvas frame(100, 20);
    render_session(ctx, frame);
    assert(frame.contains("company_name"));
    assert(frame.contains("1 rows"));
    assert(frame.contains("<Ctrl+N> New Row"));

    // Edit the name cell of row 1
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(sess.mode() == input_mode::text);
    type_text(ctx, "Ann");
    handle_key_event(ctx, key_event::special(key_code::backspace));
    type_text(ctx, "n");
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(sess.mode() == input_mode::bind);
    assert(ctx.connection().get_field_in_table_row<std::string>("trainer", row_id(1), "name") == "Ann");

    // Esc cancels an edit
    handle_key_event(ctx, key_event::special(key_code::right));
    handle_key_event(ctx, key_event::special(key_code::enter));
    type_text(ctx, "Acme");
    handle_key_event(ctx, key_event::special(key_code::escape));
    assert(sess.mode() == input_mode::bind);
    assert(!ctx.connection().get_field_in_table_row<std::optional<std::string>>("trainer", row_id(1), "company_name"));

    render_session(ctx, frame);
    assert(frame.contains("Ann"));

    // New row, then delete it again
    handle_key_event(ctx, ctrl('n'));
    assert(ctx.connection().get_table_row_ids("trainer").size() == 2);
    handle_key_event(ctx, ctrl('d'));
    auto ids = ctx.connection().get_table_row_ids("trainer");
    assert(ids.size() == 1 && ids[0] == row_id(1));

    // Integer columns reject text and keep the edit open
    handle_key_event(ctx, key_event::special(key_code::escape));
    assert(sess.selected()->impl->title(ctx, id) == "Edit Table");
    render_session(ctx, frame);
    assert(frame.contains(">trainer"));
    handle_key_event(ctx, key_event::special(key_code::down));
    handle_key_event(ctx, key_event::special(key_code::down));
    handle_key_event(ctx, key_event::special(key_code::down));
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(sess.selected()->impl->title(ctx, id) == "Edit Table: session");

    handle_key_event(ctx, ctrl('n'));
    handle_key_event(ctx, key_event::special(key_code::right));
    handle_key_event(ctx, key_event::special(key_code::enter));
    type_text(ctx, "x");
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(sess.mode() == input_mode::text);
    render_session(ctx, frame);
    assert(frame.contains("Invalid value for trainer (INTEGER)"));

    handle_key_event(ctx, key_event::special(key_code::backspace));
    type_text(ctx, "1");
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(sess.mode() == input_mode::bind);
    assert(ctx.connection().get_field_in_table_row<row_id>("session", row_id(1), "trainer") == row_id(1));

    // Clearing an integer cell stores NULL
    handle_key_event(ctx, key_event::special(key_code::enter));
    handle_key_event(ctx, key_event::special(key_code::backspace));
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(!ctx.connection().get_field_in_table_row<std::optional<row_id>>("session", row_id(1), "trainer"));

    std::cout << "  Edit table tab test passed!" << std::endl;
}

// ============================================================================
// Test: Tab Kinds From The Chooser
// ============================================================================

void test_db_tabs_in_chooser() {
    std::cout << "Testing database tab kinds..." << std::endl;

    trellis::context ctx;
    ctx.in_memory_db(true);
    add_plugins(ctx);
    ctx.startup();

    const auto& catalog = *ctx.get_resource<tab_catalog>();
    assert(catalog.find("Database Info") && catalog.find("Edit Table"));

    assert(text_of(ctx.execute("tui")) == "Opening TUI session...");
    auto& sess = *ctx.get_resource<session>();

    canvas frame(100, 20);
    render_session(ctx, frame);
    assert(frame.contains("> Database Info"));

    handle_key_event(ctx, key_event::special(key_code::enter));
    render_session(ctx, frame);
    assert(frame.contains("Database connection open."));
    assert(frame.contains("No database path (in-memory connection)"));

    ctx.connection().delete_db();
    render_session(ctx, frame);
    assert(frame.contains("No database connection open."));

    // An Edit Table tab without a connection shows the error instead of failing
    handle_key_event(ctx, ctrl('t'));
    handle_key_event(ctx, key_event::special(key_code::down));
    handle_key_event(ctx, key_event::special(key_code::enter));
    assert(sess.selected()->impl->title(ctx, sess.selected()->id) == "Edit Table");
    render_session(ctx, frame);
    assert(frame.contains("NoConnectionError"));
    handle_key_event(ctx, key_event::special(key_code::enter));

    std::cout << "  Database tab kinds test passed!" << std::endl;
}

// ============================================================================
// Test: Plugin Order
// ============================================================================

void test_plugin_order() {
    std::cout << "Testing plugin order..." << std::endl;

    // Without the tui plugin the database commands still register, minus the TUI parts
    trellis::context ctx;
    ctx.in_memory_db(true);
    ctx.add_plugin<trellis::training::training_plugin>();
    ctx.add_plugin<trellis::db_commands::db_commands_plugin>();
    ctx.startup();

    assert(ctx.router().has_command("list"));
    assert(!ctx.router().has_command("edit"));
    assert(!ctx.has_resource<tab_catalog>());

    // Adding the same plugin twice clashes on command names
    bool threw = false;
    try {
        ctx.add_plugin<trellis::db_commands::db_commands_plugin>();
    } catch (const trellis::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Plugin order test passed!" << std::endl;
}

int main() {
    std::cout << "=== TrellisCommands Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_training_tables();
        test_row_commands();
        test_db_commands();
        test_backup_restore();
        test_edit_table_tab();
        test_db_tabs_in_chooser();
        test_plugin_order();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (7 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
