#include "cliapp/options.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <optional>

namespace cliapp {

namespace {

std::optional<spdlog::level::level_enum> parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace

OptionsParseResult parse_options(const std::string& json_str, const std::string& source_path) {
    OptionsParseResult result;
    std::string where = source_path.empty() ? std::string("options") : source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = where + ": JSON must be an object";
            return result;
        }

        for (auto& [key, val] : j.items()) {
            if (key == "exit_on_failure") {
                if (val.is_boolean()) {
                    result.options.exit_on_failure = val.get<bool>();
                } else {
                    result.warnings.push_back(where + ": exit_on_failure must be a boolean");
                }
            } else if (key == "program_name") {
                if (val.is_string() && !val.get<std::string>().empty()) {
                    result.options.program_name = val.get<std::string>();
                } else {
                    result.warnings.push_back(where + ": program_name must be a non-empty string");
                }
            } else if (key == "log_level") {
                if (val.is_string() && parse_level(val.get<std::string>())) {
                    result.options.log_level = val.get<std::string>();
                } else {
                    result.warnings.push_back(where + ": unknown log_level");
                }
            } else {
                result.warnings.push_back(where + ": unknown key " + key);
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = where + ": " + e.what();
    }

    for (const auto& warning : result.warnings) {
        spdlog::warn("{}", warning);
    }
    return result;
}

bool apply_log_level(const std::string& level) {
    auto parsed = parse_level(level);
    if (!parsed) return false;
    spdlog::set_level(*parsed);
    return true;
}

} // namespace cliapp
