#include "cliapp/text.hpp"

#include <cctype>
#include <sstream>

namespace cliapp {

namespace {

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Shared by to_kebab and to_words: a separator before each interior
// uppercase letter, '_' mapped to the separator, never two in a row
std::string split_words(const std::string& name, char sep) {
    std::string out;
    out.reserve(name.size() + 4);
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_') {
            if (!out.empty() && out.back() != sep) out.push_back(sep);
            continue;
        }
        if (is_upper(c)) {
            if (i > 0 && !out.empty() && out.back() != sep) out.push_back(sep);
            out.push_back(lower(c));
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& token : tokens) {
        if (!out.empty()) out.push_back(' ');
        out += token;
    }
    return out;
}

std::string to_kebab(const std::string& name) {
    return split_words(name, '-');
}

std::string to_words(const std::string& name) {
    return split_words(name, ' ');
}

bool is_help_token(const std::string& token) {
    return token == "-h" || token == "--help";
}

bool is_root_help_token(const std::string& token) {
    return is_help_token(token) || token == "help";
}

} // namespace cliapp
