#include "soberlauncher/commandmachine.hpp"
#include "soberlauncher/internalaliases.hpp" // required for sl_mgmt and sl_util aliases
#include "soberlauncher/util.hpp"
#include "commandregistry.hpp"
#include "handlers.hpp"
#include <iostream>

int
main(int argc, char* argv[]) {
    if (!sl_util::command_exists("flatpak")) {
        std::cerr << "Warning: flatpak is not installed, launching will fail\n";
    }

    // Create command parser
    auto parser = cm::command_parser::create("soberlauncherctl");

    // Parse and execute command
    return parser->parse(command_registry, argc, argv);
}
