// seda/basic/casting.hpp - Kind checks and checked downcasts for syntax nodes
//
// A node class opts in by declaring `static bool classof(const AstNode *)`.
// Category classes (Expr, Stmt) test a kind range, concrete classes test one
// kind. isa<> accepts several targets and succeeds when any of them matches:
//
//   if (isa<StringLiteral, InterpolatedString>(value)) { ... }
//   if (const auto * call = dyn_cast<CallExpr>(expr)) { ... }
//
#pragma once

#include <cassert>
#include <type_traits>

namespace seda
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

template <typename From, typename T>
bool matches(const From * node)
{
  static_assert(HasClassof<T, From>::value, "node class is missing classof()");
  return T::classof(node);
}

}  // namespace detail

/// False for null. With more than one target, true when any target matches.
template <typename T, typename... More, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  if (node == nullptr) {
    return false;
  }
  return (detail::matches<From, T>(node) || ... || detail::matches<From, More>(node));
}

/// The caller guarantees the kind; a mismatch is a programming error.
template <typename T, typename From>
[[nodiscard]] inline auto cast(From * node) noexcept
  -> std::conditional_t<std::is_const_v<From>, const T *, T *>
{
  assert(isa<T>(node) && "cast<> to a node class of another kind");
  return static_cast<std::conditional_t<std::is_const_v<From>, const T *, T *>>(node);
}

template <typename T, typename From>
[[nodiscard]] inline auto dyn_cast(From * node) noexcept
  -> std::conditional_t<std::is_const_v<From>, const T *, T *>
{
  using Result = std::conditional_t<std::is_const_v<From>, const T *, T *>;
  return isa<T>(node) ? static_cast<Result>(node) : nullptr;
}

}  // namespace seda
