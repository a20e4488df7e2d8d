#pragma once

/**
 * @file describe.hpp
 * @brief Machine-readable view of a registry
 *
 * Built from the same metadata the binder and help renderer use:
 *
 * ```json
 * {
 *   "root": null,
 *   "commands": [
 *     {"path": "create", "help": "", "expects_error": false,
 *      "params": [{"kind": "record", "label": "<value>",
 *                  "fields": [{"name": "Input", "kind": "string", "position": 0, ...}]}]}
 *   ]
 * }
 * ```
 */

#include "cliapp/handler.hpp"
#include "cliapp/registry.hpp"

#include <nlohmann/json.hpp>

namespace cliapp {

nlohmann::json describe_handler(const Handler& handler);

nlohmann::json describe(const CommandRegistry& registry);

} // namespace cliapp
