#include "cliapp/field_table.hpp"

namespace cliapp {

std::optional<int> FieldTable::max_position() const {
    if (positional.empty()) return std::nullopt;
    return positional.rbegin()->first;
}

FieldTable extract_fields(const RecordSchemaBase& schema) {
    FieldTable table;
    const auto& fields = schema.fields();

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& field = fields[i];

        if (field.position) {
            table.positional[*field.position] = i;
            // A positional field is also an option when explicitly named
            if (field.long_name) table.long_names[*field.long_name] = i;
        } else {
            table.long_names[field.effective_long_name()] = i;
        }

        if (field.short_name) table.short_names[*field.short_name] = i;
    }

    return table;
}

} // namespace cliapp
