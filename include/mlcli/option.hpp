#ifndef MLCLI_OPTION_HPP
#define MLCLI_OPTION_HPP

#include <optional>
#include <string>
#include <utility>

#include "type_spec.hpp"
#include "value.hpp"

namespace mlcli {

class Node;

class Option {
public:
    // A boolean flag, default false.
    Option(std::string longName, std::string shortName, std::string description)
        : longName_(std::move(longName)),
          shortName_(std::move(shortName)),
          description_(std::move(description)),
          type_(TypeSpec::boolean()),
          flag_(true) {}

    // A value-bearing option. The default literal is parsed against `type` when the option is attached to a node.
    Option(std::string longName,
           std::string shortName,
           std::string description,
           TypeSpec type,
           std::optional<std::string> defaultLiteral = std::nullopt)
        : longName_(std::move(longName)),
          shortName_(std::move(shortName)),
          description_(std::move(description)),
          type_(std::move(type)),
          defaultLiteral_(std::move(defaultLiteral)) {}

    // Namespace key override; defaults to the long name, else the short name.
    Option& setTarget(std::string target) {
        target_ = std::move(target);
        return *this;
    }

    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] const std::string& shortName() const { return shortName_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const TypeSpec& type() const { return type_; }
    [[nodiscard]] bool isFlag() const { return flag_; }
    [[nodiscard]] const std::optional<std::string>& defaultLiteral() const { return defaultLiteral_; }
    [[nodiscard]] const std::optional<Value>& defaultValue() const { return defaultValue_; }

    [[nodiscard]] const std::string& targetName() const {
        if (!target_.empty()) return target_;
        return longName_.empty() ? shortName_ : longName_;
    }

    // "--spouse/-s", "--long", "-m".
    [[nodiscard]] std::string display() const {
        std::string out;
        if (!longName_.empty()) out = "--" + longName_;
        if (!shortName_.empty()) out += (out.empty() ? "-" : "/-") + shortName_;
        return out;
    }

private:
    friend class Node;

    std::string longName_;  // spouse
    std::string shortName_; // s
    std::string description_;
    std::string target_;
    TypeSpec type_;
    bool flag_{false};
    std::optional<std::string> defaultLiteral_;
    std::optional<Value> defaultValue_;
};

} // namespace mlcli

#endif // MLCLI_OPTION_HPP
