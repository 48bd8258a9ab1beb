#pragma once

/** \file classify.hpp
 *  \brief Map a raw error to its reported error through a rule_book.
 *
 * errors::improper_use() is never reclassified: it comes back unchanged
 * with tier exact before any rule is consulted.
 *
 * Precedence (first match wins):
 *   1. exact     error is registered as exact        -> error
 *   2. mapping   error is a mapping key              -> mapped error
 *   3. pattern   message matches a pattern, in registration order -> target
 *   4. fallback  a fallback is set                   -> fallback
 *   5. unmatched policy decides: passthrough -> error, unexpected -> errors::unexpected()
 *
 * Explicit registrations always beat pattern matches; the fallback is only a
 * backstop. The null identity never matches exact or mapping rules.
 */

#include <cstdint>
#include <string_view>

#include "triage/error_id.hpp"
#include "triage/rule_book.hpp"

namespace triage {

enum class match_tier : std::uint8_t { exact, mapping, pattern, fallback, unmatched };

enum class unmatched_policy : std::uint8_t { passthrough, unexpected };

struct classification {
  error_id result;
  match_tier tier{match_tier::unmatched};

  [[nodiscard]] bool matched() const noexcept { return tier != match_tier::unmatched; }
};

[[nodiscard]] auto classify(const error_id& e, const rule_book& book,
                            unmatched_policy policy = unmatched_policy::passthrough) -> classification;

/** \brief Classification with no rules at all. */
[[nodiscard]] auto classify_unmatched(const error_id& e, unmatched_policy policy) -> classification;

[[nodiscard]] auto to_string(match_tier t) noexcept -> std::string_view;

} // namespace triage
