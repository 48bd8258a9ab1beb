#include "triage/classify.hpp"

namespace triage {

auto classify(const error_id& e, const rule_book& book, unmatched_policy policy) -> classification {
  // Misuse keeps its fixed identity; no rule may rewrite it.
  if (e == errors::improper_use()) return {e, match_tier::exact};
  auto hit = book.read([&](const rule_set& r) -> classification {
    if (e) {
      if (r.exact.contains(e)) return {e, match_tier::exact};
      if (auto it = r.mappings.find(e); it != r.mappings.end()) return {it->second, match_tier::mapping};
    }
    const auto msg = e.message();
    for (const auto& p : r.patterns) {
      if (p.matches(msg)) return {p.target, match_tier::pattern};
    }
    if (r.fallback) return {*r.fallback, match_tier::fallback};
    return {error_id{}, match_tier::unmatched};
  });
  if (hit.matched()) return hit;
  return classify_unmatched(e, policy);
}

auto classify_unmatched(const error_id& e, unmatched_policy policy) -> classification {
  if (policy == unmatched_policy::unexpected) return {errors::unexpected(), match_tier::unmatched};
  return {e, match_tier::unmatched};
}

auto to_string(match_tier t) noexcept -> std::string_view {
  switch (t) {
    case match_tier::exact: return "exact";
    case match_tier::mapping: return "mapping";
    case match_tier::pattern: return "pattern";
    case match_tier::fallback: return "fallback";
    case match_tier::unmatched: return "unmatched";
  }
  return "unknown";
}

} // namespace triage
