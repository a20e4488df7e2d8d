#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace cliapp {

// ============================================================================
// App Options
// ============================================================================

struct Options {
    // Write failures to the error sink and call `exit(1)` instead of only
    // returning them
    bool exit_on_failure = false;

    std::ostream* out = nullptr;   // help output (null: std::cout)
    std::ostream* err = nullptr;   // failure messages (null: std::cerr)

    // Shown in the root handler's usage line. When empty: argv[0] from the
    // last run(argc, argv), or "command"
    std::string program_name;

    // spdlog level name applied when the App is constructed (see
    // apply_log_level); empty leaves the current level alone
    std::string log_level;

    // Process exit hook (null: std::exit)
    std::function<void(int)> exit;
};

// ============================================================================
// Options Parsing Result
// ============================================================================

struct OptionsParseResult {
    bool ok = false;
    std::string error;
    Options options;
    std::vector<std::string> warnings;
};

/**
 * @brief Read Options from a JSON document
 *
 * Recognized keys: "exit_on_failure" (bool), "program_name" (string),
 * "log_level" (string). Unknown keys and wrongly typed values produce
 * warnings and leave the default in place. Sinks and the exit hook are
 * never configured from JSON.
 */
OptionsParseResult parse_options(const std::string& json_str,
                                 const std::string& source_path = "");

// Set the spdlog level from a name (trace, debug, info, warn, error,
// critical, off). Returns false and leaves the level unchanged otherwise.
bool apply_log_level(const std::string& level);

} // namespace cliapp
