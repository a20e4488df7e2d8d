#pragma once

#include "cliapp/export.hpp"
#include "cliapp/handler.hpp"
#include "cliapp/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cliapp {

/**
 * @brief Handlers keyed by whitespace-tokenized command paths
 *
 * Paths are normalized ("remote   add" and "remote add" are the same key).
 * Entries keep registration order; re-adding a path replaces its handler in
 * place. The empty path registers the root handler.
 */
class CLIAPP_API CommandRegistry {
public:
    struct Entry {
        std::string path;                 // normalized, single-spaced
        std::vector<std::string> tokens;
        Handler handler;
    };

    struct Resolution {
        std::size_t matched = 0;          // input tokens that named the command
        std::string name;                 // path, or "(root)"
        const Handler* handler = nullptr;
    };

    void add(const std::string& path, Handler handler);

    /**
     * @brief Longest registered path that prefixes the input
     *
     * Falls back to the root handler (matched == 0) when nothing matches.
     * Fails with UNKNOWN_COMMAND when there is no match and no root.
     * Among equally long matches the earliest registration wins.
     */
    Result<Resolution> resolve(const std::vector<std::string>& tokens) const;

    const Handler* root() const { return root_ ? &*root_ : nullptr; }

    /// Non-root entries in registration order
    const std::vector<Entry>& commands() const { return entries_; }

private:
    std::vector<Entry> entries_;
    std::optional<Handler> root_;
};

} // namespace cliapp
