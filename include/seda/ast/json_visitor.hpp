// seda/ast/json_visitor.hpp - Syntax tree as nlohmann::json (`sedac json`)
#pragma once

#include <nlohmann/json.hpp>

#include "seda/ast/ast.hpp"

namespace seda
{

/// {"type": "VarStmt", "range": {"start": 0, "end": 9}, ...fields}
///
/// Unset optional fields are left out. A null node gives {"type": "null"}
/// with a null range.
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace seda
