#include "cliapp/registry.hpp"
#include "cliapp/text.hpp"

#include <spdlog/spdlog.h>

namespace cliapp {

void CommandRegistry::add(const std::string& path, Handler handler) {
    auto tokens = split_fields(path);

    if (tokens.empty()) {
        if (root_) spdlog::warn("root handler registered twice; replacing");
        root_ = std::move(handler);
        return;
    }

    std::string key = join_tokens(tokens);
    for (auto& entry : entries_) {
        if (entry.path == key) {
            spdlog::warn("command '{}' registered twice; replacing", key);
            entry.handler = std::move(handler);
            return;
        }
    }
    entries_.push_back(Entry{key, std::move(tokens), std::move(handler)});
}

Result<CommandRegistry::Resolution> CommandRegistry::resolve(
    const std::vector<std::string>& tokens) const {
    const Entry* best = nullptr;

    for (const auto& entry : entries_) {
        if (entry.tokens.size() > tokens.size()) continue;

        bool match = true;
        for (std::size_t i = 0; i < entry.tokens.size(); ++i) {
            if (tokens[i] != entry.tokens[i]) {
                match = false;
                break;
            }
        }
        if (match && (!best || entry.tokens.size() > best->tokens.size())) {
            best = &entry;
        }
    }

    Resolution resolution;
    if (best) {
        resolution.matched = best->tokens.size();
        resolution.name = best->path;
        resolution.handler = &best->handler;
    } else if (root_) {
        resolution.matched = 0;
        resolution.name = "(root)";
        resolution.handler = &*root_;
    } else {
        std::string first = tokens.empty() ? "" : tokens.front();
        return Result<Resolution>::err(Error(ErrorCode::UNKNOWN_COMMAND,
                                             "unknown command: " + first));
    }

    spdlog::debug("resolved '{}' ({} of {} tokens)", resolution.name,
                  resolution.matched, tokens.size());
    return Result<Resolution>::ok(std::move(resolution));
}

} // namespace cliapp
