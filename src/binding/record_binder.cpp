#include "cliapp/record_binder.hpp"
#include "cliapp/coerce.hpp"
#include "cliapp/field_table.hpp"
#include "cliapp/text.hpp"

#include <spdlog/spdlog.h>

namespace cliapp {

namespace {

Result<void> set_field(std::any& record, const FieldSpec& field, const std::string& token) {
    auto value = coerce(token, field.kind);
    if (value.isErr()) {
        return Result<void>::err(value.error());
    }
    field.assign(record, value.value());
    return Result<void>::ok();
}

// Shared by "--name" and "-n": flags are set, other fields take the next token.
// Returns the number of tokens used.
Result<std::size_t> apply_named(std::any& record, const FieldSpec& field,
                                const std::vector<std::string>& tokens, std::size_t i) {
    const std::string& name = tokens[i];
    if (field.is_flag()) {
        field.assign(record, Value(true));
        return Result<std::size_t>::ok(1);
    }
    if (i + 1 >= tokens.size()) {
        return Result<std::size_t>::err(Error(ErrorCode::MISSING_OPTION_VALUE,
                                              "missing value for " + name));
    }
    auto set = set_field(record, field, tokens[i + 1]);
    if (set.isErr()) {
        return Result<std::size_t>::err(set.error().withContext("failed to parse value for option " + name));
    }
    return Result<std::size_t>::ok(2);
}

Error unknown_option(const std::string& token) {
    return Error(ErrorCode::UNKNOWN_OPTION, "unknown option: " + token);
}

} // namespace

Result<BoundRecord> bind_record(const std::vector<std::string>& tokens,
                                const RecordSchemaBase& schema) {
    const auto& fields = schema.fields();
    FieldTable table = extract_fields(schema);
    std::any record = schema.instantiate();
    std::size_t consumed = 0;

    // Positionals: 0..max in order, gaps consume nothing
    if (auto max = table.max_position()) {
        for (int p = 0; p <= *max; ++p) {
            auto it = table.positional.find(p);
            if (it == table.positional.end()) continue;

            if (consumed >= tokens.size()) {
                return Result<BoundRecord>::err(Error(ErrorCode::INSUFFICIENT_ARGS,
                    "not enough positional args: need position " + std::to_string(p)));
            }
            auto set = set_field(record, fields[it->second], tokens[consumed]);
            if (set.isErr()) {
                return Result<BoundRecord>::err(set.error().withContext(
                    "failed to parse positional arg at position " + std::to_string(p)));
            }
            ++consumed;
        }
    }

    // Options until the first non-option token
    std::size_t i = consumed;
    while (i < tokens.size()) {
        const std::string& tok = tokens[i];

        if (has_prefix(tok, "--")) {
            auto eq = tok.find('=');
            if (eq != std::string::npos) {
                std::string name = tok.substr(0, eq);
                auto it = table.long_names.find(name);
                if (it == table.long_names.end()) {
                    return Result<BoundRecord>::err(unknown_option(name));
                }
                auto set = set_field(record, fields[it->second], tok.substr(eq + 1));
                if (set.isErr()) {
                    return Result<BoundRecord>::err(set.error().withContext(
                        "failed to parse value for option " + name));
                }
                ++i;
                continue;
            }

            auto it = table.long_names.find(tok);
            if (it == table.long_names.end()) {
                return Result<BoundRecord>::err(unknown_option(tok));
            }
            auto used = apply_named(record, fields[it->second], tokens, i);
            if (used.isErr()) return Result<BoundRecord>::err(used.error());
            i += used.value();
            continue;
        }

        if (tok.size() >= 2 && tok[0] == '-') {
            auto it = table.short_names.find(tok);
            if (it == table.short_names.end()) {
                return Result<BoundRecord>::err(unknown_option(tok));
            }
            auto used = apply_named(record, fields[it->second], tokens, i);
            if (used.isErr()) return Result<BoundRecord>::err(used.error());
            i += used.value();
            continue;
        }

        break;
    }

    spdlog::debug("record bound: {} positional, {} total of {} tokens",
                  consumed, i, tokens.size());

    BoundRecord bound;
    bound.value = std::move(record);
    bound.consumed = i;
    return Result<BoundRecord>::ok(std::move(bound));
}

} // namespace cliapp
