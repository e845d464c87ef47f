#ifndef MLCLI_ARGUMENT_HPP
#define MLCLI_ARGUMENT_HPP

#include <cstddef>
#include <string>
#include <utility>

#include "type_spec.hpp"

namespace mlcli {

// A mandatory positional parameter of a command. Immutable once the command has accepted it.
class Argument {
public:
    Argument(std::string name, TypeSpec type, std::string description, std::size_t position)
        : name_(std::move(name)),
          type_(std::move(type)),
          description_(std::move(description)),
          position_(position) {}

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const TypeSpec& type() const { return type_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    // Zero-based declaration order.
    [[nodiscard]] std::size_t position() const { return position_; }

private:
    std::string name_;
    TypeSpec type_;
    std::string description_;
    std::size_t position_;
};

} // namespace mlcli

#endif // MLCLI_ARGUMENT_HPP
