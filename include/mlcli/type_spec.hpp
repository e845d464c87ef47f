#ifndef MLCLI_TYPE_SPEC_HPP
#define MLCLI_TYPE_SPEC_HPP

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "value.hpp"

namespace mlcli {

// Converts trimmed scalar text into a Value; the string alternative is the reason for a rejection.
using Coercion = std::function<std::variant<Value, std::string>(std::string_view text)>;

struct FieldSpec;

// Type descriptor governing literal parsing: a scalar kind, an array of T, or a struct of named fields.
//
// Scalars are declared by kind name ("int", "string", ...). The coercion is resolved against the root
// parser's ScalarRegistry when the spec is attached to an argument or option, so an unknown kind is a
// definition-time error rather than a parse-time one.
class TypeSpec {
public:
    enum class Kind {
        Scalar,
        Array,
        Struct,
    };

    // A string scalar.
    TypeSpec();

    static TypeSpec scalar(std::string kind);
    static TypeSpec array(TypeSpec element);
    // Throws DefinitionError(DuplicateName) when two fields share a name.
    static TypeSpec structOf(std::vector<FieldSpec> fields);

    static TypeSpec text();
    static TypeSpec boolean();
    static TypeSpec integer();
    static TypeSpec number();
    static TypeSpec duration();

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isScalar() const { return kind_ == Kind::Scalar; }
    [[nodiscard]] bool isArray() const { return kind_ == Kind::Array; }
    [[nodiscard]] bool isStruct() const { return kind_ == Kind::Struct; }

    [[nodiscard]] const std::string& scalarKind() const { return scalarKind_; }
    // Empty until bound by a ScalarRegistry.
    [[nodiscard]] const Coercion& coercion() const { return coercion_; }
    [[nodiscard]] const TypeSpec& element() const { return element_.front(); }
    [[nodiscard]] const std::vector<FieldSpec>& fields() const;
    [[nodiscard]] const FieldSpec* findField(std::string_view name) const;

    // True when every scalar reachable from this spec has a coercion.
    [[nodiscard]] bool bound() const;

    // "int", "[int]", "{name: string, age?: int}".
    [[nodiscard]] std::string name() const;

private:
    friend class ScalarRegistry;

    Kind kind_{Kind::Scalar};
    std::string scalarKind_{"string"};
    Coercion coercion_;
    // Exactly one entry for arrays.
    std::vector<TypeSpec> element_;
    std::vector<FieldSpec> fields_;
};

struct FieldSpec {
    FieldSpec(std::string fieldName, TypeSpec fieldType, bool isOptional = false)
        : name(std::move(fieldName)), type(std::move(fieldType)), optional(isOptional) {}

    std::string name;
    TypeSpec type;
    // Optional fields may be left out of a struct literal without MissingField.
    bool optional{false};
};

// Scalar kind name -> coercion. Built-ins: bool, int, int64, uint64, float, double, duration, string.
class ScalarRegistry {
public:
    ScalarRegistry();

    // Throws DefinitionError(DuplicateName) if the kind already exists, InvalidDefinition on an empty name
    // or an empty coercion.
    void add(std::string kind, Coercion coercion);

    [[nodiscard]] bool contains(std::string_view kind) const;
    [[nodiscard]] const Coercion* find(std::string_view kind) const;
    // Registration order, built-ins first.
    [[nodiscard]] const std::vector<std::string>& kinds() const { return order_; }

    // Resolves every scalar of `spec` to its coercion.
    // Throws DefinitionError(InvalidDefinition) on an unregistered kind.
    void bind(TypeSpec& spec) const;

private:
    std::unordered_map<std::string, Coercion> coercions_;
    std::vector<std::string> order_;
};

// Shared registry with only the built-in kinds; used for specs parsed without being bound first.
const ScalarRegistry& builtinScalars();

} // namespace mlcli

#endif // MLCLI_TYPE_SPEC_HPP
