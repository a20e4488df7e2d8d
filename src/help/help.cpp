#include "cliapp/help.hpp"
#include "cliapp/field_table.hpp"
#include "cliapp/text.hpp"

#include <algorithm>
#include <map>

namespace cliapp {

namespace {

bool primitive_only(const Handler& handler) {
    return !handler.uses_records();
}

// Display names of positional fields across all record parameters
std::map<int, std::string> positional_names(const Handler& handler) {
    std::map<int, std::string> names;
    for (const auto& param : handler.params) {
        if (param.kind != Kind::Record) continue;
        const auto& fields = param.record->fields();
        for (const auto& [position, index] : extract_fields(*param.record).positional) {
            const FieldSpec& field = fields[index];
            names[position] = field.help.empty() ? to_words(field.name) : field.help;
        }
    }
    return names;
}

void render_option_fields(std::ostream& out, const Handler& handler) {
    for (const auto& param : handler.params) {
        if (param.kind != Kind::Record) continue;
        for (const auto& field : param.record->fields()) {
            if (field.is_positional()) continue;

            std::string type_label;
            if (!field.is_flag()) {
                type_label = std::string(" ") + kind_label(field.kind);
            }
            if (field.short_name) {
                out << "  " << *field.short_name << "|" << field.effective_long_name()
                    << type_label << "    " << field.help << "\n";
            } else {
                out << "  " << field.effective_long_name() << type_label
                    << "    " << field.help << "\n";
            }
        }
    }
}

} // namespace

void render_common_options(std::ostream& out) {
    out << "Options:\n";
    out << "  -h|--help               Show this help\n";
}

void render_global_help(std::ostream& out, const CommandRegistry& registry) {
    if (registry.root() == nullptr) {
        out << "Usage: [options...]\n\n";
    } else {
        out << "Usage:\n";
        out << "  command <args...> [options...]\n\n";
    }

    out << "Commands:\n";

    std::size_t width = 0;
    for (const auto& entry : registry.commands()) {
        width = std::max(width, entry.path.size());
    }
    for (const auto& entry : registry.commands()) {
        if (!entry.handler.help.empty()) {
            std::string padded = entry.path + std::string(width - entry.path.size(), ' ');
            out << "  " << padded << "  " << entry.handler.help << "\n";
        } else {
            out << "  " << entry.path << "\n";
        }
    }
    out << "\n";

    render_common_options(out);
}

void render_command_help(std::ostream& out,
                         const std::string& name,
                         const Handler& handler,
                         const CommandRegistry* subcommands) {
    if (!handler.help.empty()) {
        out << handler.help << "\n\n";
    }

    // Parameter names are not available; positional parameters are arg0, arg1, ...
    if (primitive_only(handler) && !handler.params.empty()) {
        out << "Usage: " << name << " <args...>\n\n";
        out << "Arguments:\n";
        for (std::size_t i = 0; i < handler.params.size(); ++i) {
            out << "  [" << i << "] arg" << i << " " << kind_label(handler.params[i].kind) << "\n";
        }
        out << "\n";
        render_common_options(out);
        return;
    }

    auto positionals = positional_names(handler);
    int max_pos = positionals.empty() ? -1 : positionals.rbegin()->first;

    if (max_pos >= 0) {
        out << "Usage: " << name << " <args...> [options...]\n\n";
        out << "Arguments:\n";
        for (int i = 0; i <= max_pos; ++i) {
            auto it = positionals.find(i);
            std::string label = it != positionals.end() ? it->second : "arg" + std::to_string(i);
            out << "  [" << i << "] " << label << "\n";
        }
        out << "\n";
    } else {
        out << "Usage: " << name << " [options...]\n\n";
    }

    if (subcommands != nullptr) {
        out << "Commands:\n";
        for (const auto& entry : subcommands->commands()) {
            out << "  " << entry.path << " (args: " << entry.handler.params.size() << ")\n";
        }
        out << "\n";
    }

    render_common_options(out);
    render_option_fields(out, handler);
}

} // namespace cliapp
