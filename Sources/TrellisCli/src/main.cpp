#include <Trellis.hpp>
#include <TrellisTraining.hpp>
#include <TrellisTui.hpp>
#include <TrellisDbCommands.hpp>
#include <iostream>

namespace {

trellis::configuration load_configuration() {
    trellis::configuration config;
    if (auto path = trellis::configuration::default_path(config.app_name)) {
        config = trellis::configuration::load(*path);
    }
    config.apply_environment();
    return config;
}

} // namespace

int main(int argc, char** argv) {
    try {
        trellis::context ctx;
        ctx.configure(load_configuration());

        // The tui plugin adds the tab catalog the later plugins register into
        ctx.add_plugin<trellis::tui::tui_plugin>();
        ctx.add_plugin<trellis::training::training_plugin>();
        ctx.add_plugin<trellis::db_commands::db_commands_plugin>();
        ctx.startup();

        auto response = ctx.execute(argc, argv);
        if (response.text) {
            std::cout << *response.text << std::endl;
        }

        if (ctx.has_resource<trellis::tui::session>()) {
            trellis::tui::run_tui(ctx);
        }
        return 0;
    } catch (const trellis::error& e) {
        std::cerr << "error: " << trellis::describe(e) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
