#pragma once

/**
 * @file record.hpp
 * @brief Record schemas: explicit field metadata for record parameters
 *
 * A record type opts in by providing a static describe function that lists
 * its fields. Each field declares its binding role up front:
 *
 * ```cpp
 * struct CreateArgs {
 *     std::string input;
 *     std::string output;
 *     bool use_markdown = false;
 *     std::optional<int> level;
 *
 *     static void describe(cliapp::RecordSchema<CreateArgs>& s) {
 *         s.field("Input", &CreateArgs::input).arg(0).help("input file");
 *         s.field("Output", &CreateArgs::output).long_name("--out").short_name("-o");
 *         s.field("UseMarkdown", &CreateArgs::use_markdown).long_name("--usemarkdown");
 *         s.field("Level", &CreateArgs::level);   // --level <int>, optional
 *     }
 * };
 * ```
 *
 * Precedence: a positional index makes the field positional (explicit
 * long/short names still register it as an option as well); otherwise the
 * field is an option named "--" + kebab-case(name). Boolean fields are
 * always flags.
 */

#include "cliapp/export.hpp"
#include "cliapp/value.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cliapp {

// ============================================================================
// Field Descriptor
// ============================================================================

struct FieldSpec {
    std::string name;                       // declared name, e.g. "OutDir"
    Kind kind = Kind::String;
    bool optional = false;                  // std::optional<T> member
    std::optional<int> position;            // .arg(N)
    std::optional<std::string> long_name;   // .long_name("--x")
    std::optional<std::string> short_name;  // .short_name("-x")
    std::string help;

    // Assigns a coerced value to the member of a type-erased record instance
    std::function<void(std::any&, const Value&)> assign;

    bool is_flag() const { return kind == Kind::Bool; }
    bool is_positional() const { return position.has_value(); }

    // Long name used for lookup and help: override or "--" + kebab(name)
    std::string effective_long_name() const;
};

// ============================================================================
// Schema
// ============================================================================

class CLIAPP_API RecordSchemaBase {
public:
    virtual ~RecordSchemaBase() = default;

    const std::vector<FieldSpec>& fields() const { return fields_; }

    // Default-constructed record wrapped in std::any
    virtual std::any instantiate() const = 0;

    // Reject what the builder cannot: empty names, malformed long/short
    // spellings, negative or duplicate positions. Throws RegistrationError.
    // Positional gaps and duplicate option names are accepted and logged.
    void validate() const;

protected:
    std::vector<FieldSpec> fields_;
};

/**
 * @brief Chained setters for the field most recently added to a schema
 */
class CLIAPP_API FieldBuilder {
public:
    FieldBuilder(std::vector<FieldSpec>& fields, std::size_t index)
        : fields_(&fields), index_(index) {}

    FieldBuilder& arg(int position);
    FieldBuilder& long_name(std::string name);
    FieldBuilder& short_name(std::string name);
    FieldBuilder& help(std::string text);

    // Accepted for readability; boolean fields are flags regardless
    FieldBuilder& flag() { return *this; }

private:
    FieldSpec& spec() { return (*fields_)[index_]; }

    std::vector<FieldSpec>* fields_;
    std::size_t index_;
};

template<typename T>
class RecordSchema : public RecordSchemaBase {
public:
    template<typename M>
    FieldBuilder field(std::string name, M T::*member) {
        using traits = field_traits<M>;
        using V = typename traits::value_type;
        static_assert(primitive_kind<V>::supported,
                      "record fields must be string, int, int64_t, double, bool "
                      "or std::optional of one of them");

        FieldSpec spec;
        spec.name = std::move(name);
        spec.kind = primitive_kind<V>::kind;
        spec.optional = traits::optional;
        spec.assign = [member](std::any& record, const Value& value) {
            std::any_cast<T&>(record).*member = std::get<V>(value);
        };
        fields_.push_back(std::move(spec));
        return FieldBuilder(fields_, fields_.size() - 1);
    }

    std::any instantiate() const override { return T{}; }
};

// ============================================================================
// Record detection
// ============================================================================

template<typename T, typename = void>
struct is_record : std::false_type {};

template<typename T>
struct is_record<T, std::void_t<decltype(T::describe(std::declval<RecordSchema<T>&>()))>>
    : std::true_type {};

/// Build and validate the schema of a record type
template<typename T>
std::shared_ptr<const RecordSchemaBase> schema_for() {
    static_assert(is_record<T>::value,
                  "record types must provide static void describe(cliapp::RecordSchema<T>&)");
    auto schema = std::make_shared<RecordSchema<T>>();
    T::describe(*schema);
    schema->validate();
    return schema;
}

} // namespace cliapp
