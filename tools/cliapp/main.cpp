/**
 * cliapp-demo - Entry Point
 *
 * Example program wiring a few commands into a cliapp::App.
 */

#include "common.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <string>

// Forward declarations for commands
namespace cliapp::demo::commands {
    void setup_math(cliapp::App& app);
    void setup_text(cliapp::App& app);
    void setup_remote(cliapp::App& app);
    void setup_describe(cliapp::App& app);
}

namespace {

struct GlobalArgs {
    bool verbose = false;
    std::optional<std::string> log_level;

    static void describe(cliapp::RecordSchema<GlobalArgs>& s) {
        s.field("Verbose", &GlobalArgs::verbose).short_name("-v").help("Debug logging");
        s.field("LogLevel", &GlobalArgs::log_level).help("trace|debug|info|warn|error|off");
    }
};

// Optional settings file in the working directory
const char* const kSettingsFile = "cliapp-demo.json";

cliapp::Options load_settings(const std::string& path) {
    cliapp::Options defaults;
    defaults.program_name = "cliapp-demo";

    std::ifstream file(path);
    if (!file) {
        return defaults;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = cliapp::parse_options(buffer.str(), path);
    if (!parsed.ok) {
        std::cerr << "Warning: ignoring " << parsed.error << std::endl;
        return defaults;
    }
    if (parsed.options.program_name.empty()) {
        parsed.options.program_name = defaults.program_name;
    }
    return parsed.options;
}

} // namespace

int main(int argc, char** argv) {
    using namespace cliapp::demo;

    cliapp::Options options = load_settings(kSettingsFile);
    if (options.log_level.empty()) {
        options.log_level = "warn";
    }

    cliapp::App app(options);

    // Root: global switches when no command is named
    app.add("", "cliapp-demo - typed command-line binding examples",
            [](const GlobalArgs& args) -> cliapp::Result<void> {
        if (args.log_level && !cliapp::apply_log_level(*args.log_level)) {
            return fail("unknown log level: " + *args.log_level);
        }
        if (args.verbose) {
            cliapp::apply_log_level("debug");
        }
        std::cout << "No command given; try --help" << std::endl;
        return cliapp::Result<void>::ok();
    });

    commands::setup_math(app);
    commands::setup_text(app);
    commands::setup_remote(app);
    commands::setup_describe(app);

    auto result = app.run(argc, argv);
    if (result.isErr()) {
        print_error(result.error());
        return 1;
    }
    return 0;
}
