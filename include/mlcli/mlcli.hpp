#ifndef MLCLI_MLCLI_HPP
#define MLCLI_MLCLI_HPP

#include "argument.hpp"
#include "cli.hpp"
#include "error.hpp"
#include "literal_parser.hpp"
#include "namespace.hpp"
#include "node.hpp"
#include "option.hpp"
#include "resolver.hpp"
#include "result.hpp"
#include "type_spec.hpp"
#include "utils.hpp"
#include "value.hpp"

#endif // MLCLI_MLCLI_HPP
