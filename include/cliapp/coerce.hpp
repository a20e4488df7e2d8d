#pragma once

/**
 * @file coerce.hpp
 * @brief String token -> primitive value conversion
 *
 * Supported kinds and accepted spellings:
 * - String:  any token, unchanged
 * - Int:     base-10 integer that fits in int
 * - Int64:   base-10 integer that fits in std::int64_t
 * - Float64: decimal floating point, whole token consumed
 * - Bool:    1 t T TRUE true True / 0 f F FALSE false False
 *
 * Coercing to Kind::Record fails with UNSUPPORTED_TYPE; a token that does
 * not parse fails with MALFORMED_VALUE naming the token and the kind.
 */

#include "cliapp/result.hpp"
#include "cliapp/value.hpp"

#include <string>

namespace cliapp {

Result<Value> coerce(const std::string& token, Kind kind);

} // namespace cliapp
