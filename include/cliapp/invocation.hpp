#pragma once

#include "cliapp/handler.hpp"
#include "cliapp/result.hpp"

#include <string>
#include <vector>

namespace cliapp {

/**
 * @brief Bind the post-command tokens to a handler's parameter list
 * @param name Command name used in error messages
 *
 * Record mode (any record parameter): parameters are filled left to right
 * from a shared cursor; primitives take one token, records take whatever
 * the record binder consumes. Leftover tokens are ignored.
 *
 * Positional mode (primitives only): any "--" token is UNKNOWN_OPTION, the
 * token count must equal the parameter count (ARG_COUNT_MISMATCH), then
 * each token is coerced in order.
 */
Result<std::vector<BoundArgument>> bind_arguments(const std::string& name,
                                                  const Handler& handler,
                                                  const std::vector<std::string>& tokens);

/// Call the handler; an error result from an error-reporting handler is returned
Result<void> invoke(const Handler& handler, std::vector<BoundArgument>& args);

} // namespace cliapp
