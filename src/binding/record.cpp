#include "cliapp/record.hpp"
#include "cliapp/result.hpp"
#include "cliapp/text.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <set>

namespace cliapp {

namespace {

[[noreturn]] void reject(const std::string& message) {
    throw RegistrationError(Error(ErrorCode::INVALID_REGISTRATION, message));
}

bool valid_long_name(const std::string& name) {
    return name.size() > 2 && has_prefix(name, "--") && name.find('=') == std::string::npos;
}

bool valid_short_name(const std::string& name) {
    return name.size() >= 2 && name[0] == '-' && name[1] != '-';
}

} // namespace

std::string FieldSpec::effective_long_name() const {
    if (long_name) return *long_name;
    return "--" + to_kebab(name);
}

// ============================================================================
// FieldBuilder
// ============================================================================

FieldBuilder& FieldBuilder::arg(int position) {
    spec().position = position;
    return *this;
}

FieldBuilder& FieldBuilder::long_name(std::string name) {
    spec().long_name = std::move(name);
    return *this;
}

FieldBuilder& FieldBuilder::short_name(std::string name) {
    spec().short_name = std::move(name);
    return *this;
}

FieldBuilder& FieldBuilder::help(std::string text) {
    spec().help = std::move(text);
    return *this;
}

// ============================================================================
// Schema validation
// ============================================================================

void RecordSchemaBase::validate() const {
    std::map<int, std::string> positions;
    std::set<std::string> long_seen;
    std::set<std::string> short_seen;

    for (const auto& field : fields_) {
        if (field.name.empty()) {
            reject("record field name must not be empty");
        }
        if (field.long_name && !valid_long_name(*field.long_name)) {
            reject("field " + field.name + ": long name must look like --name, got \"" +
                   *field.long_name + "\"");
        }
        if (field.short_name && !valid_short_name(*field.short_name)) {
            reject("field " + field.name + ": short name must look like -n, got \"" +
                   *field.short_name + "\"");
        }

        if (field.position) {
            int p = *field.position;
            if (p < 0) {
                reject("field " + field.name + ": positional index must be >= 0");
            }
            auto [it, inserted] = positions.emplace(p, field.name);
            if (!inserted) {
                reject("fields " + it->second + " and " + field.name +
                       " share positional index " + std::to_string(p));
            }
        }

        // Mirrors extract_fields: positional fields are only named when
        // they carry an explicit override
        if (!field.position || field.long_name) {
            std::string long_name = field.effective_long_name();
            if (long_name == "--") {
                reject("field " + field.name + ": name yields an empty option name; "
                       "give it a long name or a position");
            }
            if (!long_seen.insert(long_name).second) {
                spdlog::warn("option {} declared twice; field {} takes it", long_name, field.name);
            }
        }
        if (field.short_name && !short_seen.insert(*field.short_name).second) {
            spdlog::warn("option {} declared twice; field {} takes it",
                         *field.short_name, field.name);
        }
    }

    if (!positions.empty()) {
        int max = positions.rbegin()->first;
        for (int p = 0; p <= max; ++p) {
            if (positions.count(p) == 0) {
                spdlog::warn("positional index {} is not declared; it will be skipped", p);
            }
        }
    }
}

} // namespace cliapp
