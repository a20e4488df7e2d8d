#pragma once

#include "cliapp/handler.hpp"
#include "cliapp/registry.hpp"

#include <ostream>
#include <string>

namespace cliapp {

/// Help option line shared by every help screen
void render_common_options(std::ostream& out);

/// Listing of every registered command, used when no root handler exists
void render_global_help(std::ostream& out, const CommandRegistry& registry);

/**
 * @brief Usage, arguments and options of one handler
 * @param name Command path, or the program name for the root handler
 * @param subcommands Non-null when rendering the root handler; its commands
 *        are listed with their parameter counts
 */
void render_command_help(std::ostream& out,
                         const std::string& name,
                         const Handler& handler,
                         const CommandRegistry* subcommands = nullptr);

} // namespace cliapp
