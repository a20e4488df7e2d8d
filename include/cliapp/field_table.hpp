#pragma once

#include "cliapp/record.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace cliapp {

/**
 * @brief Lookup tables derived from a record schema
 *
 * Values are indices into RecordSchemaBase::fields(). Recomputed for every
 * binding and help request; never stored.
 */
struct FieldTable {
    std::map<int, std::size_t> positional;
    std::map<std::string, std::size_t> long_names;
    std::map<std::string, std::size_t> short_names;

    // Highest declared positional index, if any
    std::optional<int> max_position() const;
};

// Classify every field of a schema. Later declarations win on name clashes.
FieldTable extract_fields(const RecordSchemaBase& schema);

} // namespace cliapp
