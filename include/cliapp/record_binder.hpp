#pragma once

#include "cliapp/record.hpp"
#include "cliapp/result.hpp"

#include <any>
#include <cstddef>
#include <string>
#include <vector>

namespace cliapp {

struct BoundRecord {
    std::any value;             // instance of the schema's record type
    std::size_t consumed = 0;   // tokens used by positionals + options
};

/**
 * @brief Populate a record from tokens
 *
 * Positional fields are filled first, in ascending index order, one token
 * each. Then named options are scanned left to right:
 *   --name=value, --name [value], -n [value]
 * Flags (boolean fields) never take a separate value token. Scanning stops
 * at the first token that is not an option; trailing tokens are left for
 * the caller.
 *
 * Errors: INSUFFICIENT_ARGS, MISSING_OPTION_VALUE, UNKNOWN_OPTION,
 * MALFORMED_VALUE.
 */
Result<BoundRecord> bind_record(const std::vector<std::string>& tokens,
                                const RecordSchemaBase& schema);

} // namespace cliapp
