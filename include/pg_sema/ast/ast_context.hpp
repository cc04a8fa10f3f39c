// pg_sema/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns every AST node and interned string of an analysis run.
// Allocation comes from a std::pmr::monotonic_buffer_resource; nothing is
// freed before the context itself is destroyed.
//
#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace pg_sema
{

class AstNode;

/**
 * Arena for AST nodes plus an interning string pool.
 *
 * @code
 *   AstContext ctx;
 *   std::string_view name = ctx.intern("users");  // stable view
 *   auto * rv = ctx.create<RangeVar>(std::string_view{}, name, range);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  // PMR resources are neither copyable nor movable
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Construct a node of type T in the arena.
   *
   * @return Non-owning pointer, valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string; equal strings share storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  /**
   * Intern the ASCII lower-case form of `s` (SQL identifier folding).
   */
  [[nodiscard]] std::string_view intern_folded(std::string_view s)
  {
    std::string lowered(s);
    for (char & c : lowered) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return intern(lowered);
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return string_pool_.size(); }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate `size` value-initialized elements from the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /**
   * Copy a vector into an arena array.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace pg_sema
