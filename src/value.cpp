#include "mlcli/value.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <type_traits>

namespace {

bool needsQuoting(std::string_view s) {
    if (s.empty()) return true;
    if (std::isspace(static_cast<unsigned char>(s.front())) || std::isspace(static_cast<unsigned char>(s.back()))) {
        return true;
    }
    for (const char ch : s) {
        switch (ch) {
            case ',':
            case '[':
            case ']':
            case '{':
            case '}':
            case '=':
            case ':':
            case '"':
            case '\'':
            case '\\':
                return true;
            default:
                if (std::isspace(static_cast<unsigned char>(ch))) return true;
        }
    }
    return false;
}

std::string quote(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (const char ch : s) {
        if (ch == '"' || ch == '\\') out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

// Shortest of the two precisions that still reads back to the same value.
template <typename T>
std::string formatFloating(T v) {
    constexpr int shortDigits = std::is_same_v<T, float> ? 7 : 15;
    constexpr int fullDigits = std::is_same_v<T, float> ? 9 : 17;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*g", shortDigits, static_cast<double>(v));
    T back{};
    if constexpr (std::is_same_v<T, float>) {
        back = std::strtof(buf, nullptr);
    } else {
        back = std::strtod(buf, nullptr);
    }
    if (back != v) std::snprintf(buf, sizeof(buf), "%.*g", fullDigits, static_cast<double>(v));
    return buf;
}

} // namespace

namespace mlcli {

const Value* Value::field(std::string_view name) const {
    const auto* s = std::get_if<Struct>(&data_);
    if (!s) return nullptr;
    for (const auto& f : *s) {
        if (f.name == name) return &f.value;
    }
    return nullptr;
}

std::string Value::typeName() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, int>) {
                return "int";
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return "int64";
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return "uint64";
            } else if constexpr (std::is_same_v<T, float>) {
                return "float";
            } else if constexpr (std::is_same_v<T, double>) {
                return "double";
            } else if constexpr (std::is_same_v<T, std::chrono::milliseconds>) {
                return "duration";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "string";
            } else if constexpr (std::is_same_v<T, Array>) {
                return "array";
            } else {
                return "struct";
            }
        },
        data_);
}

std::string Value::toString() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return formatFloating(v);
            } else if constexpr (std::is_same_v<T, std::chrono::milliseconds>) {
                return std::to_string(v.count()) + "ms";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return needsQuoting(v) ? quote(v) : v;
            } else if constexpr (std::is_same_v<T, Array>) {
                std::string out = "[";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i) out += ", ";
                    out += v[i].toString();
                }
                out += "]";
                return out;
            } else if constexpr (std::is_same_v<T, Struct>) {
                std::string out = "{";
                for (std::size_t i = 0; i < v.size(); ++i) {
                    if (i) out += ", ";
                    out += v[i].name + "=" + v[i].value.toString();
                }
                out += "}";
                return out;
            } else {
                return std::to_string(v);
            }
        },
        data_);
}

} // namespace mlcli
