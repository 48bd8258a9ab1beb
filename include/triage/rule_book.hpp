#pragma once

/** \file rule_book.hpp
 *  \brief Classification rules for one scope.
 *
 * Holds four rule tiers consulted by classify():
 * - exact: identities that pass through unchanged
 * - mappings: identity -> identity substitutions
 * - patterns: message prefix or regex -> identity, kept in registration order
 * - fallback: optional backstop identity
 *
 * Registration overwrites silently (last write wins). Re-registering a pattern
 * with the same text and kind replaces its target and keeps its position.
 *
 * Thread-safety: registration takes an exclusive lock, read() a shared lock.
 * Registering everything at startup is still the intended usage.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <regex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "triage/error.hpp"
#include "triage/error_id.hpp"

namespace triage {

enum class pattern_kind : std::uint8_t { prefix, regex };

/** \brief One pattern rule. compiled is engaged for regex rules only. */
struct pattern_rule {
  pattern_kind kind{pattern_kind::prefix};
  std::string text;
  std::optional<std::regex> compiled;
  error_id target;

  [[nodiscard]] bool matches(std::string_view message) const;
};

/** \brief The rule tiers as stored. Only reachable through rule_book::read(). */
struct rule_set {
  std::unordered_set<error_id> exact;
  std::unordered_map<error_id, error_id> mappings;
  std::vector<pattern_rule> patterns;
  std::optional<error_id> fallback;
};

class rule_book {
public:
  explicit rule_book(pattern_kind default_kind = pattern_kind::prefix) : default_kind_(default_kind) {}

  rule_book(const rule_book&) = delete;
  rule_book& operator=(const rule_book&) = delete;

  void register_exact(const error_id& e);
  void register_mapping(const error_id& from, const error_id& to);

  /** \brief Register a pattern of the book's default kind. */
  auto register_pattern(std::string text, const error_id& to) -> std::expected<void, core::error>;
  void register_prefix(std::string prefix, const error_id& to);
  /** \brief Fails with invalid_argument, leaving the book unchanged, when expr does not compile. */
  auto register_regex(std::string expr, const error_id& to) -> std::expected<void, core::error>;

  void set_fallback(const error_id& e);
  void clear_fallback();
  void clear();

  /** \brief Run fn(const rule_set&) under the shared lock and return its result. */
  template <typename Fn>
  auto read(Fn&& fn) const -> decltype(std::forward<Fn>(fn)(std::declval<const rule_set&>())) {
    std::shared_lock lock(mu_);
    return std::forward<Fn>(fn)(rules_);
  }

  [[nodiscard]] auto default_kind() const noexcept -> pattern_kind { return default_kind_; }
  [[nodiscard]] auto exact_count() const -> std::size_t;
  [[nodiscard]] auto mapping_count() const -> std::size_t;
  [[nodiscard]] auto pattern_count() const -> std::size_t;
  [[nodiscard]] bool has_fallback() const;

private:
  void upsert_pattern(pattern_rule rule);

  pattern_kind default_kind_;
  mutable std::shared_mutex mu_;
  rule_set rules_;
};

} // namespace triage
