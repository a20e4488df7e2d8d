#pragma once

#include <string>
#include <vector>

namespace cliapp {

// Split on runs of whitespace; leading/trailing whitespace yields no tokens
std::vector<std::string> split_fields(const std::string& s);

// Join tokens with single spaces
std::string join_tokens(const std::vector<std::string>& tokens);

// OutDir -> out-dir, use_markdown -> use-markdown
std::string to_kebab(const std::string& name);

// FilePath -> file path
std::string to_words(const std::string& name);

inline bool has_prefix(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

// -h or --help (recognized before and after the command path)
bool is_help_token(const std::string& token);

// -h, --help or the bare word "help" (recognized before the command path only)
bool is_root_help_token(const std::string& token);

} // namespace cliapp
