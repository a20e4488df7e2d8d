#include "cliapp/coerce.hpp"

#include <cctype>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <stdexcept>

namespace cliapp {

namespace {

Error malformed(const std::string& token, Kind kind) {
    return Error(ErrorCode::MALFORMED_VALUE,
                 "invalid value \"" + token + "\" for " + kind_label(kind));
}

// std::sto* skip leading whitespace and stop at trailing garbage; a token
// is only accepted when it is consumed exactly
bool starts_clean(const std::string& token) {
    return !token.empty() && !std::isspace(static_cast<unsigned char>(token[0]));
}

Result<Value> parse_integer(const std::string& token, Kind kind) {
    if (!starts_clean(token)) return Result<Value>::err(malformed(token, kind));

    long long parsed = 0;
    size_t pos = 0;
    try {
        parsed = std::stoll(token, &pos, 10);
    } catch (const std::invalid_argument&) {
        return Result<Value>::err(malformed(token, kind));
    } catch (const std::out_of_range&) {
        return Result<Value>::err(malformed(token, kind));
    }
    if (pos != token.size()) return Result<Value>::err(malformed(token, kind));

    if (kind == Kind::Int) {
        if (parsed < INT_MIN || parsed > INT_MAX) {
            return Result<Value>::err(malformed(token, kind));
        }
        return Result<Value>::ok(Value(static_cast<int>(parsed)));
    }
    return Result<Value>::ok(Value(static_cast<std::int64_t>(parsed)));
}

Result<Value> parse_float(const std::string& token) {
    if (!starts_clean(token)) return Result<Value>::err(malformed(token, Kind::Float64));

    double parsed = 0.0;
    size_t pos = 0;
    try {
        parsed = std::stod(token, &pos);
    } catch (const std::invalid_argument&) {
        return Result<Value>::err(malformed(token, Kind::Float64));
    } catch (const std::out_of_range&) {
        // stod also throws on underflow; subnormals and values that round
        // to zero are accepted, only overflow is rejected
        char* end = nullptr;
        parsed = std::strtod(token.c_str(), &end);
        if (std::fabs(parsed) == HUGE_VAL) {
            return Result<Value>::err(malformed(token, Kind::Float64));
        }
        pos = static_cast<size_t>(end - token.c_str());
    }
    if (pos != token.size()) return Result<Value>::err(malformed(token, Kind::Float64));
    return Result<Value>::ok(Value(parsed));
}

Result<Value> parse_bool(const std::string& token) {
    if (token == "1" || token == "t" || token == "T" ||
        token == "TRUE" || token == "true" || token == "True") {
        return Result<Value>::ok(Value(true));
    }
    if (token == "0" || token == "f" || token == "F" ||
        token == "FALSE" || token == "false" || token == "False") {
        return Result<Value>::ok(Value(false));
    }
    return Result<Value>::err(malformed(token, Kind::Bool));
}

} // namespace

Result<Value> coerce(const std::string& token, Kind kind) {
    switch (kind) {
        case Kind::String:
            return Result<Value>::ok(Value(token));
        case Kind::Int:
        case Kind::Int64:
            return parse_integer(token, kind);
        case Kind::Float64:
            return parse_float(token);
        case Kind::Bool:
            return parse_bool(token);
        default:
            break;
    }
    return Result<Value>::err(Error(ErrorCode::UNSUPPORTED_TYPE,
                                    std::string("unsupported parameter type: ") + kind_name(kind)));
}

} // namespace cliapp
