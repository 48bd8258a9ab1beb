#include "triage/rule_book.hpp"

#include <algorithm>

namespace triage {

bool pattern_rule::matches(std::string_view message) const {
  if (kind == pattern_kind::regex) {
    return compiled && std::regex_search(message.begin(), message.end(), *compiled);
  }
  return message.starts_with(text);
}

void rule_book::register_exact(const error_id& e) {
  std::unique_lock lock(mu_);
  rules_.exact.insert(e);
}

void rule_book::register_mapping(const error_id& from, const error_id& to) {
  std::unique_lock lock(mu_);
  rules_.mappings.insert_or_assign(from, to);
}

auto rule_book::register_pattern(std::string text, const error_id& to) -> std::expected<void, core::error> {
  if (default_kind_ == pattern_kind::regex) return register_regex(std::move(text), to);
  register_prefix(std::move(text), to);
  return {};
}

void rule_book::register_prefix(std::string prefix, const error_id& to) {
  upsert_pattern(pattern_rule{pattern_kind::prefix, std::move(prefix), std::nullopt, to});
}

auto rule_book::register_regex(std::string expr, const error_id& to) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::regex compiled;
  try {
    compiled = std::regex(expr, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    return std::unexpected(error{error_code::invalid_argument,
                                 "bad pattern '" + expr + "': " + e.what(), "triage.rules"});
  }
  upsert_pattern(pattern_rule{pattern_kind::regex, std::move(expr), std::move(compiled), to});
  return {};
}

void rule_book::upsert_pattern(pattern_rule rule) {
  std::unique_lock lock(mu_);
  auto it = std::find_if(rules_.patterns.begin(), rules_.patterns.end(), [&](const pattern_rule& p) {
    return p.kind == rule.kind && p.text == rule.text;
  });
  if (it != rules_.patterns.end()) {
    it->target = rule.target;
    return;
  }
  rules_.patterns.push_back(std::move(rule));
}

void rule_book::set_fallback(const error_id& e) {
  std::unique_lock lock(mu_);
  rules_.fallback = e;
}

void rule_book::clear_fallback() {
  std::unique_lock lock(mu_);
  rules_.fallback.reset();
}

void rule_book::clear() {
  std::unique_lock lock(mu_);
  rules_ = rule_set{};
}

auto rule_book::exact_count() const -> std::size_t {
  return read([](const rule_set& r) { return r.exact.size(); });
}

auto rule_book::mapping_count() const -> std::size_t {
  return read([](const rule_set& r) { return r.mappings.size(); });
}

auto rule_book::pattern_count() const -> std::size_t {
  return read([](const rule_set& r) { return r.patterns.size(); });
}

bool rule_book::has_fallback() const {
  return read([](const rule_set& r) { return r.fallback.has_value(); });
}

} // namespace triage
