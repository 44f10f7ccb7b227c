// seda/ast/ast_context.hpp - Storage for the nodes of one parsed script
#pragma once

#include <algorithm>
#include <cstddef>
#include <gsl/span>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace seda
{

class AstNode;

/**
 * Arena behind a ParsedUnit.
 *
 * Nodes, identifier text and child lists all live in one monotonic buffer
 * and are released together when the context is destroyed. Parsers for
 * string interpolation fragments allocate into the context of the parser
 * that spawned them, so fragment nodes outlive the sub-parser.
 *
 * Nodes therefore hold `std::string_view` and `gsl::span`, never owning
 * containers.
 */
class AstContext
{
public:
  AstContext() : arena_(k_first_block), names_(&arena_) {}

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;

  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "only syntax nodes live in the arena");
    static_assert(std::is_trivially_destructible_v<T>, "arena nodes are never destroyed");
    return ::new (arena_.allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
  }

  /// Arena copy of `text`. Repeated names resolve to the same storage.
  [[nodiscard]] std::string_view intern(std::string_view text)
  {
    if (text.empty()) {
      return {};
    }
    const auto found = names_.find(text);
    if (found != names_.end()) {
      return *found;
    }
    auto * chars = static_cast<char *>(arena_.allocate(text.size(), alignof(char)));
    std::copy(text.begin(), text.end(), chars);
    return *names_.emplace(chars, text.size()).first;
  }

  /// Freezes a child list built during parsing.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    static_assert(std::is_trivially_copyable_v<T>, "child lists hold pointers or views");
    if (items.empty()) {
      return {};
    }
    auto * out = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::copy(items.begin(), items.end(), out);
    return gsl::span<T>(out, items.size());
  }

private:
  static constexpr size_t k_first_block = size_t{64} * 1024;

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
};

}  // namespace seda
