#include "triage/scope.hpp"

#include <mutex>

namespace triage {

auto scope_table::resolve(std::string_view key) -> std::shared_ptr<rule_book> {
  const std::string k(key);
  {
    std::shared_lock lock(mu_);
    if (auto it = books_.find(k); it != books_.end()) return it->second;
  }
  std::unique_lock lock(mu_);
  auto [it, inserted] = books_.try_emplace(k, nullptr);
  if (inserted) it->second = std::make_shared<rule_book>(default_kind_);
  return it->second;
}

bool scope_table::contains(std::string_view key) const {
  std::shared_lock lock(mu_);
  return books_.find(std::string(key)) != books_.end();
}

auto scope_table::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return books_.size();
}

auto scope_table::global() -> scope_table& {
  // Leaked: guards running during static destruction still resolve.
  static auto* table = new scope_table();
  return *table;
}

} // namespace triage
