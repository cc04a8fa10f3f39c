// pg_sema/basic/diagnostic_codes.hpp - Stable diagnostic codes
#pragma once

#include <string_view>

namespace pg_sema::diag_code
{

// Syntax
inline constexpr std::string_view k_syntax_error = "E0001";

// Catalog and dependency graph
inline constexpr std::string_view k_duplicate_object = "E0101";
inline constexpr std::string_view k_dependency_cycle = "E0102";

// Resolution
inline constexpr std::string_view k_relation_not_found = "E0201";
inline constexpr std::string_view k_unknown_type = "E0202";
inline constexpr std::string_view k_unknown_column = "E0203";
inline constexpr std::string_view k_unknown_function = "E0204";

// Constructs the analyzer recognizes but does not model
inline constexpr std::string_view k_unsupported_construct = "E0301";

// Warnings
inline constexpr std::string_view k_unhandled_statement = "W0401";

}  // namespace pg_sema::diag_code
