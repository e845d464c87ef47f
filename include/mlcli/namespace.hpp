#ifndef MLCLI_NAMESPACE_HPP
#define MLCLI_NAMESPACE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace mlcli {

// Ordered key -> Value mapping with dotted-path lookup.
//
// Lookup of "a.b.c" tries the exact key first. Otherwise the longest key that is a dotted prefix of the path is
// taken and the rest of the path descends into its value: struct fields by name, array elements by index
// ("family.1.name").
class Namespace {
public:
    struct Entry {
        std::string key;
        Value value;
    };

    Namespace() = default;

    // Replaces the value of an existing key in place, otherwise appends.
    void set(std::string key, Value value);

    [[nodiscard]] bool contains(std::string_view path) const { return find(path) != nullptr; }
    [[nodiscard]] const Value* find(std::string_view path) const;
    // Throws std::out_of_range when nothing is found.
    [[nodiscard]] const Value& at(std::string_view path) const;
    [[nodiscard]] const Value& operator[](std::string_view path) const { return at(path); }

    // Throws std::out_of_range on a missing path and std::bad_variant_access on a type mismatch.
    template <typename T>
    [[nodiscard]] const T& get(std::string_view path) const {
        return at(path).as<T>();
    }

    template <typename T>
    [[nodiscard]] T getOr(std::string_view path, T fallback) const {
        const Value* v = find(path);
        if (!v) return fallback;
        const T* p = v->getIf<T>();
        return p ? *p : fallback;
    }

    // Entries below "prefix." with the prefix stripped, in order.
    [[nodiscard]] Namespace subNamespace(std::string_view prefix) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    // "{key=value, ...}" using Value::toString.
    [[nodiscard]] std::string toString() const;

private:
    const Entry* exact(std::string_view key) const;

    std::vector<Entry> entries_;
};

} // namespace mlcli

#endif // MLCLI_NAMESPACE_HPP
