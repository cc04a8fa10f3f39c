// pg_sema/sema/builtin_functions.cpp - pg_catalog function table
#include "pg_sema/sema/builtin_functions.hpp"

#include <algorithm>
#include <iterator>

namespace pg_sema
{
namespace
{

using R = ResultRule;
using N = NullRule;

// clang-format off
constexpr BuiltinFunction k_builtin_functions[] = {
  // Aggregates. Only count() is non-null over an empty input.
  {"count", R::Fixed, "int8", 0, N::Never, true},
  {"sum", R::Sum, "", 0, N::Always, true},
  {"avg", R::Avg, "", 0, N::Always, true},
  {"min", R::FirstArg, "", 0, N::Always, true},
  {"max", R::FirstArg, "", 0, N::Always, true},
  {"array_agg", R::FirstArgArray, "", 0, N::Always, true},
  {"string_agg", R::Fixed, "text", 0, N::Always, true},
  {"bool_and", R::Fixed, "bool", 0, N::Always, true},
  {"bool_or", R::Fixed, "bool", 0, N::Always, true},
  {"every", R::Fixed, "bool", 0, N::Always, true},
  {"json_agg", R::Fixed, "json", 0, N::Always, true},
  {"jsonb_agg", R::Fixed, "jsonb", 0, N::Always, true},
  {"json_object_agg", R::Fixed, "json", 0, N::Always, true},
  {"jsonb_object_agg", R::Fixed, "jsonb", 0, N::Always, true},

  // Window functions
  {"row_number", R::Fixed, "int8", 0, N::Never, false},
  {"rank", R::Fixed, "int8", 0, N::Never, false},
  {"dense_rank", R::Fixed, "int8", 0, N::Never, false},
  {"lag", R::FirstArg, "", 0, N::Always, false},
  {"lead", R::FirstArg, "", 0, N::Always, false},
  {"first_value", R::FirstArg, "", 0, N::Always, false},
  {"last_value", R::FirstArg, "", 0, N::Always, false},

  // Conditional
  {"coalesce", R::FirstArg, "", 0, N::AllArgs, false},
  {"greatest", R::FirstArg, "", 0, N::AllArgs, false},
  {"least", R::FirstArg, "", 0, N::AllArgs, false},
  {"nullif", R::FirstArg, "", 0, N::Always, false},

  // JSON
  {"json_build_object", R::Fixed, "json", 0, N::Never, false},
  {"jsonb_build_object", R::Fixed, "jsonb", 0, N::Never, false},
  {"json_build_array", R::Fixed, "json", 0, N::Never, false},
  {"jsonb_build_array", R::Fixed, "jsonb", 0, N::Never, false},
  {"json_object", R::Fixed, "json", 0, N::Strict, false},
  {"jsonb_object", R::Fixed, "jsonb", 0, N::Strict, false},
  {"to_json", R::Fixed, "json", 0, N::Strict, false},
  {"to_jsonb", R::Fixed, "jsonb", 0, N::Strict, false},
  {"row_to_json", R::Fixed, "json", 0, N::Strict, false},
  {"array_to_json", R::Fixed, "json", 0, N::Strict, false},
  {"json_extract_path", R::Fixed, "json", 0, N::Always, false},
  {"jsonb_extract_path", R::Fixed, "jsonb", 0, N::Always, false},
  {"json_extract_path_text", R::Fixed, "text", 0, N::Always, false},
  {"jsonb_extract_path_text", R::Fixed, "text", 0, N::Always, false},
  {"json_typeof", R::Fixed, "text", 0, N::Strict, false},
  {"jsonb_typeof", R::Fixed, "text", 0, N::Strict, false},
  {"json_array_length", R::Fixed, "int4", 0, N::Strict, false},
  {"jsonb_array_length", R::Fixed, "int4", 0, N::Strict, false},
  {"jsonb_set", R::Fixed, "jsonb", 0, N::Strict, false},
  {"jsonb_insert", R::Fixed, "jsonb", 0, N::Strict, false},
  {"jsonb_strip_nulls", R::Fixed, "jsonb", 0, N::Strict, false},
  {"json_strip_nulls", R::Fixed, "json", 0, N::Strict, false},
  {"jsonb_pretty", R::Fixed, "text", 0, N::Strict, false},
  {"jsonb_path_query_first", R::Fixed, "jsonb", 0, N::Always, false},
  {"jsonb_path_exists", R::Fixed, "bool", 0, N::Strict, false},

  // Arrays
  {"array_position", R::Fixed, "int4", 0, N::Always, false},
  {"array_length", R::Fixed, "int4", 0, N::Strict, false},
  {"array_upper", R::Fixed, "int4", 0, N::Strict, false},
  {"array_lower", R::Fixed, "int4", 0, N::Strict, false},
  {"cardinality", R::Fixed, "int4", 0, N::Strict, false},
  {"array_to_string", R::Fixed, "text", 0, N::Strict, false},
  {"array_append", R::FirstArg, "", 0, N::Never, false},
  {"array_cat", R::FirstArg, "", 0, N::AllArgs, false},
  {"array_remove", R::FirstArg, "", 0, N::Strict, false},
  {"array_replace", R::FirstArg, "", 0, N::Strict, false},
  {"unnest", R::FirstArgElement, "", 0, N::Always, false},
  {"string_to_array", R::Fixed, "text", 1, N::Strict, false},
  {"regexp_split_to_array", R::Fixed, "text", 1, N::Strict, false},
  {"regexp_matches", R::Fixed, "text", 1, N::Strict, false},
  {"regexp_match", R::Fixed, "text", 1, N::Always, false},

  // Strings
  {"lower", R::Fixed, "text", 0, N::Strict, false},
  {"upper", R::Fixed, "text", 0, N::Strict, false},
  {"initcap", R::Fixed, "text", 0, N::Strict, false},
  {"btrim", R::Fixed, "text", 0, N::Strict, false},
  {"ltrim", R::Fixed, "text", 0, N::Strict, false},
  {"rtrim", R::Fixed, "text", 0, N::Strict, false},
  {"substring", R::Fixed, "text", 0, N::Strict, false},
  {"substr", R::Fixed, "text", 0, N::Strict, false},
  {"overlay", R::Fixed, "text", 0, N::Strict, false},
  {"replace", R::Fixed, "text", 0, N::Strict, false},
  {"translate", R::Fixed, "text", 0, N::Strict, false},
  {"regexp_replace", R::Fixed, "text", 0, N::Strict, false},
  {"split_part", R::Fixed, "text", 0, N::Strict, false},
  {"left", R::Fixed, "text", 0, N::Strict, false},
  {"right", R::Fixed, "text", 0, N::Strict, false},
  {"lpad", R::Fixed, "text", 0, N::Strict, false},
  {"rpad", R::Fixed, "text", 0, N::Strict, false},
  {"repeat", R::Fixed, "text", 0, N::Strict, false},
  {"reverse", R::Fixed, "text", 0, N::Strict, false},
  {"md5", R::Fixed, "text", 0, N::Strict, false},
  {"encode", R::Fixed, "text", 0, N::Strict, false},
  {"decode", R::Fixed, "bytea", 0, N::Strict, false},
  {"quote_ident", R::Fixed, "text", 0, N::Strict, false},
  {"quote_literal", R::Fixed, "text", 0, N::Strict, false},
  {"quote_nullable", R::Fixed, "text", 0, N::Never, false},
  {"concat", R::Fixed, "text", 0, N::Never, false},
  {"concat_ws", R::Fixed, "text", 0, N::Never, false},
  {"format", R::Fixed, "text", 0, N::Never, false},
  {"to_char", R::Fixed, "text", 0, N::Strict, false},
  {"length", R::Fixed, "int4", 0, N::Strict, false},
  {"char_length", R::Fixed, "int4", 0, N::Strict, false},
  {"character_length", R::Fixed, "int4", 0, N::Strict, false},
  {"octet_length", R::Fixed, "int4", 0, N::Strict, false},
  {"position", R::Fixed, "int4", 0, N::Strict, false},
  {"strpos", R::Fixed, "int4", 0, N::Strict, false},
  {"ascii", R::Fixed, "int4", 0, N::Strict, false},
  {"version", R::Fixed, "text", 0, N::Never, false},

  // Numbers
  {"abs", R::FirstArg, "", 0, N::Strict, false},
  {"ceil", R::FirstArg, "", 0, N::Strict, false},
  {"ceiling", R::FirstArg, "", 0, N::Strict, false},
  {"floor", R::FirstArg, "", 0, N::Strict, false},
  {"round", R::FirstArg, "", 0, N::Strict, false},
  {"trunc", R::FirstArg, "", 0, N::Strict, false},
  {"mod", R::FirstArg, "", 0, N::Strict, false},
  {"sign", R::FirstArg, "", 0, N::Strict, false},
  {"sqrt", R::Fixed, "float8", 0, N::Strict, false},
  {"power", R::Fixed, "float8", 0, N::Strict, false},
  {"exp", R::Fixed, "float8", 0, N::Strict, false},
  {"ln", R::Fixed, "float8", 0, N::Strict, false},
  {"log", R::Fixed, "float8", 0, N::Strict, false},
  {"random", R::Fixed, "float8", 0, N::Never, false},
  {"nextval", R::Fixed, "int8", 0, N::Strict, false},
  {"currval", R::Fixed, "int8", 0, N::Strict, false},
  {"setval", R::Fixed, "int8", 0, N::Strict, false},

  // Date and time
  {"now", R::Fixed, "timestamptz", 0, N::Never, false},
  {"current_timestamp", R::Fixed, "timestamptz", 0, N::Never, false},
  {"transaction_timestamp", R::Fixed, "timestamptz", 0, N::Never, false},
  {"statement_timestamp", R::Fixed, "timestamptz", 0, N::Never, false},
  {"clock_timestamp", R::Fixed, "timestamptz", 0, N::Never, false},
  {"localtimestamp", R::Fixed, "timestamp", 0, N::Never, false},
  {"current_date", R::Fixed, "date", 0, N::Never, false},
  {"current_time", R::Fixed, "timetz", 0, N::Never, false},
  {"localtime", R::Fixed, "time", 0, N::Never, false},
  {"date_trunc", R::SecondArg, "", 0, N::Strict, false},
  {"date_part", R::Fixed, "float8", 0, N::Strict, false},
  {"extract", R::Fixed, "numeric", 0, N::Strict, false},
  {"age", R::Fixed, "interval", 0, N::Strict, false},
  {"make_interval", R::Fixed, "interval", 0, N::Strict, false},
  {"make_date", R::Fixed, "date", 0, N::Strict, false},
  {"to_timestamp", R::Fixed, "timestamptz", 0, N::Strict, false},
  {"to_date", R::Fixed, "date", 0, N::Strict, false},
  {"timezone", R::SecondArg, "", 0, N::Strict, false},

  // Session
  {"current_user", R::Fixed, "name", 0, N::Never, false},
  {"session_user", R::Fixed, "name", 0, N::Never, false},
  {"current_role", R::Fixed, "name", 0, N::Never, false},
  {"user", R::Fixed, "name", 0, N::Never, false},
  {"current_schema", R::Fixed, "name", 0, N::Never, false},
  {"current_catalog", R::Fixed, "name", 0, N::Never, false},

  // Misc
  {"gen_random_uuid", R::Fixed, "uuid", 0, N::Never, false},
  {"uuid_generate_v4", R::Fixed, "uuid", 0, N::Never, false},
  {"row", R::Fixed, "record", 0, N::Never, false},
  {"to_tsvector", R::Fixed, "tsvector", 0, N::Strict, false},
  {"to_tsquery", R::Fixed, "tsquery", 0, N::Strict, false},
  {"plainto_tsquery", R::Fixed, "tsquery", 0, N::Strict, false},
  {"websearch_to_tsquery", R::Fixed, "tsquery", 0, N::Strict, false},
  {"ts_rank", R::Fixed, "float4", 0, N::Strict, false},
  {"generate_series", R::FirstArg, "", 0, N::Strict, false},
};
// clang-format on

}  // namespace

const BuiltinFunction * find_builtin_function(std::string_view name) noexcept
{
  const auto * it = std::find_if(
    std::begin(k_builtin_functions), std::end(k_builtin_functions),
    [&](const BuiltinFunction & f) { return f.name == name; });
  return it != std::end(k_builtin_functions) ? it : nullptr;
}

}  // namespace pg_sema
