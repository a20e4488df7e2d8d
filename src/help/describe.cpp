#include "cliapp/describe.hpp"
#include "cliapp/value.hpp"

namespace cliapp {

namespace {

using json = nlohmann::json;

json describe_field(const FieldSpec& field) {
    json j;
    j["name"] = field.name;
    j["kind"] = kind_name(field.kind);
    j["optional"] = field.optional;
    j["flag"] = field.is_flag();
    j["position"] = field.position ? json(*field.position) : json(nullptr);
    if (!field.position || field.long_name) {
        j["long"] = field.effective_long_name();
    } else {
        j["long"] = nullptr;
    }
    j["short"] = field.short_name ? json(*field.short_name) : json(nullptr);
    j["help"] = field.help;
    return j;
}

} // namespace

json describe_handler(const Handler& handler) {
    json j;
    j["help"] = handler.help;
    j["expects_error"] = handler.expects_error;

    json params = json::array();
    for (const auto& param : handler.params) {
        json p;
        p["kind"] = kind_name(param.kind);
        p["label"] = kind_label(param.kind);
        if (param.kind == Kind::Record) {
            json fields = json::array();
            for (const auto& field : param.record->fields()) {
                fields.push_back(describe_field(field));
            }
            p["fields"] = fields;
        }
        params.push_back(p);
    }
    j["params"] = params;
    return j;
}

json describe(const CommandRegistry& registry) {
    json j;
    j["root"] = registry.root() ? describe_handler(*registry.root()) : json(nullptr);

    json commands = json::array();
    for (const auto& entry : registry.commands()) {
        json c = describe_handler(entry.handler);
        c["path"] = entry.path;
        commands.push_back(c);
    }
    j["commands"] = commands;
    return j;
}

} // namespace cliapp
