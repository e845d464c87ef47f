#include "mlcli/namespace.hpp"

#include <cstddef>
#include <stdexcept>

#include "mlcli/utils.hpp"

namespace mlcli {

namespace {

bool parseIndex(std::string_view s, std::size_t& out) {
    if (s.empty()) return false;
    std::size_t v = 0;
    for (const char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<std::size_t>(c - '0');
    }
    out = v;
    return true;
}

const Value* descend(const Value* v, const std::vector<std::string>& parts, std::size_t from) {
    for (std::size_t i = from; v && i < parts.size(); ++i) {
        if (v->isStruct()) {
            v = v->field(parts[i]);
            continue;
        }
        std::size_t index = 0;
        if (v->isArray() && parseIndex(parts[i], index) && index < v->array().size()) {
            v = &v->array()[index];
            continue;
        }
        return nullptr;
    }
    return v;
}

} // namespace

void Namespace::set(std::string key, Value value) {
    for (auto& e : entries_) {
        if (e.key == key) {
            e.value = std::move(value);
            return;
        }
    }
    entries_.push_back(Entry{std::move(key), std::move(value)});
}

const Namespace::Entry* Namespace::exact(std::string_view key) const {
    for (const auto& e : entries_) {
        if (e.key == key) return &e;
    }
    return nullptr;
}

const Value* Namespace::find(std::string_view path) const {
    if (const Entry* e = exact(path)) return &e->value;

    const auto parts = utils::splitPath(path);
    for (std::size_t n = parts.size(); n-- > 1;) {
        const std::vector<std::string> head(parts.begin(), parts.begin() + static_cast<std::ptrdiff_t>(n));
        const Entry* e = exact(utils::joinPath(head));
        if (!e) continue;
        return descend(&e->value, parts, n);
    }
    return nullptr;
}

const Value& Namespace::at(std::string_view path) const {
    const Value* v = find(path);
    if (!v) throw std::out_of_range("no value at \"" + std::string(path) + "\"");
    return *v;
}

Namespace Namespace::subNamespace(std::string_view prefix) const {
    Namespace out;
    const std::string head = std::string(prefix) + ".";
    for (const auto& e : entries_) {
        if (e.key.size() > head.size() && e.key.compare(0, head.size(), head) == 0) {
            out.entries_.push_back(Entry{e.key.substr(head.size()), e.value});
        }
    }
    return out;
}

std::vector<std::string> Namespace::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.key);
    return out;
}

std::string Namespace::toString() const {
    std::string out = "{";
    for (const auto& e : entries_) {
        if (out.size() > 1) out += ", ";
        out += e.key + "=" + e.value.toString();
    }
    out += "}";
    return out;
}

} // namespace mlcli
