#pragma once

/**
 * @file value.hpp
 * @brief Semantic kinds and coerced values
 *
 * Every handler parameter and record field maps to one Kind. The mapping
 * from C++ types is done at compile time by primitive_kind<T>; anything else fails
 * to compile at registration.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

namespace cliapp {

enum class Kind {
    String,
    Int,
    Int64,
    Float64,
    Bool,
    Record,
};

/// A coerced primitive. Alternative order matches Kind.
using Value = std::variant<std::string, int, std::int64_t, double, bool>;

/// Lowercase kind name ("string", "int", ..., "record")
const char* kind_name(Kind kind);

/// Help label ("<string>", "<int>", ...; "<value>" for anything else)
const char* kind_label(Kind kind);

inline bool is_primitive(Kind kind) {
    return kind != Kind::Record;
}

// ============================================================================
// C++ type -> Kind
// ============================================================================

template<typename T>
struct primitive_kind {
    static constexpr bool supported = false;
};

template<> struct primitive_kind<std::string> {
    static constexpr bool supported = true;
    static constexpr Kind kind = Kind::String;
};

template<> struct primitive_kind<int> {
    static constexpr bool supported = true;
    static constexpr Kind kind = Kind::Int;
};

template<> struct primitive_kind<std::int64_t> {
    static constexpr bool supported = true;
    static constexpr Kind kind = Kind::Int64;
};

template<> struct primitive_kind<double> {
    static constexpr bool supported = true;
    static constexpr Kind kind = Kind::Float64;
};

template<> struct primitive_kind<bool> {
    static constexpr bool supported = true;
    static constexpr Kind kind = Kind::Bool;
};

// Record fields may also be std::optional of a primitive
template<typename T>
struct field_traits {
    using value_type = T;
    static constexpr bool optional = false;
};

template<typename T>
struct field_traits<std::optional<T>> {
    using value_type = T;
    static constexpr bool optional = true;
};

} // namespace cliapp
