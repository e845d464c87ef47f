#ifndef MLCLI_VALUE_HPP
#define MLCLI_VALUE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mlcli {

class Value;
struct Field;

using Array = std::vector<Value>;
// Parsed structs list their fields in declaration order.
using Struct = std::vector<Field>;

// A typed value produced by the literal parser: one of the flag scalar types, an array or a struct.
//
// Notes:
// - Member definitions live below `Field` (and in value.cpp) because `Struct` needs a complete `Field`.
// - `as<T>()` throws std::bad_variant_access on a type mismatch; use `getIf<T>()` to probe.
class Value {
public:
    using Storage = std::variant<bool,
                                 int,
                                 std::int64_t,
                                 std::uint64_t,
                                 float,
                                 double,
                                 std::chrono::milliseconds,
                                 std::string,
                                 Array,
                                 Struct>;

    Value();
    Value(bool v);
    Value(int v);
    Value(std::int64_t v);
    Value(std::uint64_t v);
    Value(float v);
    Value(double v);
    Value(std::chrono::milliseconds v);
    Value(std::string v);
    Value(const char* v);
    Value(Array v);
    Value(Struct v);

    [[nodiscard]] const Storage& storage() const { return data_; }

    template <typename T>
    [[nodiscard]] bool is() const;
    template <typename T>
    [[nodiscard]] const T& as() const;
    template <typename T>
    [[nodiscard]] const T* getIf() const;

    [[nodiscard]] bool isArray() const;
    [[nodiscard]] bool isStruct() const;
    [[nodiscard]] bool isScalar() const { return !isArray() && !isStruct(); }

    [[nodiscard]] const Array& array() const;
    [[nodiscard]] const Struct& fields() const;
    // Struct field lookup; nullptr when this is not a struct or the field is absent.
    [[nodiscard]] const Value* field(std::string_view name) const;

    // "bool", "int", ..., "array", "struct".
    [[nodiscard]] std::string typeName() const;
    // Canonical literal text; parsing it against the matching TypeSpec yields an equal Value.
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    Storage data_;
};

struct Field {
    std::string name;
    Value value;
};

inline bool operator==(const Field& a, const Field& b) { return a.name == b.name && a.value == b.value; }
inline bool operator!=(const Field& a, const Field& b) { return !(a == b); }

inline Value::Value() : data_(false) {}
inline Value::Value(bool v) : data_(v) {}
inline Value::Value(int v) : data_(v) {}
inline Value::Value(std::int64_t v) : data_(v) {}
inline Value::Value(std::uint64_t v) : data_(v) {}
inline Value::Value(float v) : data_(v) {}
inline Value::Value(double v) : data_(v) {}
inline Value::Value(std::chrono::milliseconds v) : data_(v) {}
inline Value::Value(std::string v) : data_(std::move(v)) {}
inline Value::Value(const char* v) : data_(std::string(v)) {}
inline Value::Value(Array v) : data_(std::move(v)) {}
inline Value::Value(Struct v) : data_(std::move(v)) {}

template <typename T>
bool Value::is() const {
    return std::holds_alternative<T>(data_);
}

template <typename T>
const T& Value::as() const {
    return std::get<T>(data_);
}

template <typename T>
const T* Value::getIf() const {
    return std::get_if<T>(&data_);
}

inline bool Value::isArray() const { return std::holds_alternative<Array>(data_); }
inline bool Value::isStruct() const { return std::holds_alternative<Struct>(data_); }
inline const Array& Value::array() const { return std::get<Array>(data_); }
inline const Struct& Value::fields() const { return std::get<Struct>(data_); }

inline bool operator==(const Value& a, const Value& b) { return a.data_ == b.data_; }

} // namespace mlcli

#endif // MLCLI_VALUE_HPP
