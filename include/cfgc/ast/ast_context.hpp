// cfgc/ast/ast_context.hpp - AST arena allocator and string pool
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation. Nodes and
// arrays are never freed individually; everything goes away with the context.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cfgc
{

class AstNode;

/**
 * Owns every AST node, child array and interned string of one parse.
 *
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<IntLiteral>(42, range, tokens);
 *   std::string_view name = ctx.intern("main");
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

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /// Construct a node in the arena. The node lives as long as the context.
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes are never destroyed; use std::string_view and gsl::span members.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Return a view of an arena copy of `s`. Equal strings share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (const auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }
    if (s.empty()) {
      return *string_pool_.insert(std::string_view{}).first;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    return *string_pool_.insert(std::string_view(ptr, s.size())).first;
  }

  [[nodiscard]] size_t string_count() const noexcept { return string_pool_.size(); }

  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    static_assert(std::is_trivially_destructible_v<T>, "arena arrays are never destroyed");
    if (size == 0) return {};
    T * const ptr =
      static_cast<T *>(arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

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

}  // namespace cfgc
