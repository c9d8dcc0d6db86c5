// cfgc/basic/casting.hpp - LLVM-style RTTI helpers
//
// Works with any hierarchy whose classes expose `static bool classof(const Base *)`.
//
//   if (isa<IfStmt>(stmt)) { ... }
//   const auto * loop = cast<WhileStmt>(stmt);        // asserts on mismatch
//   if (const auto * call = dyn_cast<CallExpr>(e)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace cfgc
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

}  // namespace detail

/// True if `node` is non-null and dynamically a T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(
    detail::HasClassof<T, From>::value, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

/**
 * Checked downcast. The node must be non-null and of type T.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(static_cast<const From *>(node)) && "Invalid cast");
  return static_cast<T *>(node);
}

/// Downcast returning nullptr when `node` is null or not a T.
template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

}  // namespace cfgc
