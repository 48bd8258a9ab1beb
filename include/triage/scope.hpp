#pragma once

/** \file scope.hpp
 *  \brief Scope-keyed table of rule books.
 *
 * Independent components keep independent rules without threading a
 * rule_book through every call: each call site resolves the book for its
 * scope key. By default the key is the source file of the caller, so two
 * translation units never share a book unless they ask for the same key.
 *
 * Books are created lazily on first resolve and live as long as the table.
 * resolve() is idempotent: the same key always yields the same book.
 */

#include <memory>
#include <shared_mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <unordered_map>

#include "triage/rule_book.hpp"

namespace triage {

class scope_table {
public:
  scope_table() = default;
  explicit scope_table(pattern_kind default_kind) : default_kind_(default_kind) {}

  scope_table(const scope_table&) = delete;
  scope_table& operator=(const scope_table&) = delete;

  /** \brief Book for an explicit scope key (component name or path). */
  auto resolve(std::string_view key) -> std::shared_ptr<rule_book>;

  /** \brief Book for the caller's source file. */
  auto resolve_here(std::source_location loc = std::source_location::current()) -> std::shared_ptr<rule_book> {
    return resolve(scope_key(loc));
  }

  [[nodiscard]] bool contains(std::string_view key) const;
  [[nodiscard]] auto size() const -> std::size_t;

  /** \brief Process-wide table; never torn down. */
  static auto global() -> scope_table&;

  /** \brief Key derived from a call site: its source file path. */
  static auto scope_key(const std::source_location& loc) -> std::string { return loc.file_name(); }

private:
  pattern_kind default_kind_{pattern_kind::prefix};
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<rule_book>> books_;
};

/** \brief Book for the caller's source file in the process-wide table. */
inline auto rules_here(std::source_location loc = std::source_location::current()) -> std::shared_ptr<rule_book> {
  return scope_table::global().resolve_here(loc);
}

} // namespace triage
