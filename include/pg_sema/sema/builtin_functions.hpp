// pg_sema/sema/builtin_functions.hpp - Result rules of common pg_catalog functions
#pragma once

#include <cstdint>
#include <string_view>

namespace pg_sema
{

/// How a built-in function's result type follows from its arguments.
enum class ResultRule : uint8_t {
  Fixed,            ///< `result_type`
  FirstArg,         ///< type of the first argument
  SecondArg,        ///< type of the second argument
  FirstArgArray,    ///< array of the first argument's type
  FirstArgElement,  ///< element type of the first (array) argument
  Sum,              ///< sum(): int2/int4 -> int8, int8 -> numeric
  Avg,              ///< avg(): floats -> float8, interval -> interval, else numeric
};

/// When a built-in function returns NULL.
enum class NullRule : uint8_t {
  Strict,  ///< NULL when any argument is NULL
  Never,   ///< never NULL
  Always,  ///< may return NULL even for non-NULL input
  AllArgs, ///< NULL only when every argument is NULL (coalesce, greatest, least)
};

struct BuiltinFunction
{
  std::string_view name;
  ResultRule rule;
  std::string_view result_type;  ///< pg_catalog type for ResultRule::Fixed
  int32_t result_dims = 0;
  NullRule null_rule = NullRule::Strict;
  bool aggregate = false;
};

/// Look up a built-in function by unqualified name.
[[nodiscard]] const BuiltinFunction * find_builtin_function(std::string_view name) noexcept;

}  // namespace pg_sema
