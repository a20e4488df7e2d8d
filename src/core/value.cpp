#include "cliapp/value.hpp"

namespace cliapp {

const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::String: return "string";
        case Kind::Int: return "int";
        case Kind::Int64: return "int64";
        case Kind::Float64: return "float64";
        case Kind::Bool: return "bool";
        case Kind::Record: return "record";
    }
    return "unknown";
}

const char* kind_label(Kind kind) {
    switch (kind) {
        case Kind::String: return "<string>";
        case Kind::Int: return "<int>";
        case Kind::Int64: return "<int64>";
        case Kind::Float64: return "<float64>";
        case Kind::Bool: return "<bool>";
        default: return "<value>";
    }
}

} // namespace cliapp
