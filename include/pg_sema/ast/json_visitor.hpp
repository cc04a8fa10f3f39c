// pg_sema/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Debug dump of the SQL AST as nlohmann::json. Used by `pg-sema dump-ast`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "pg_sema/ast/ast.hpp"

namespace pg_sema
{

/**
 * Serialize an AST node to JSON.
 *
 * Every object carries a "type" (the node class name) and a "range"
 * (byte offsets); null children serialize as JSON null.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Script node including all its statements.
 */
[[nodiscard]] nlohmann::json to_json(const Script * script);

}  // namespace pg_sema
