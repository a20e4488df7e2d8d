/**
 * cliapp-demo - describe command
 *
 * Machine-readable listing of every registered command.
 */

#include "../common.hpp"

namespace cliapp::demo::commands {

void setup_describe(cliapp::App& app) {
    const cliapp::CommandRegistry* registry = &app.registry();
    app.add("describe", "Print registered commands as JSON", [registry]() {
        std::cout << cliapp::describe(*registry).dump(2) << std::endl;
    });
}

} // namespace cliapp::demo::commands
