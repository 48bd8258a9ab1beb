#pragma once

/** \file failure.hpp
 *  \brief Failure capture: build a failure record and hand it to the recovery point.
 *
 * Two transports carry the same record:
 * - thrown: ensure() and check() throw triage::failure; nothing between the
 *   failing call and dispatcher::guard() needs to check anything.
 * - returned: require() and inspect() return outcome<T>; callers propagate it
 *   with TRIAGE_TRY and hand the terminal outcome to dispatcher::conclude().
 *
 * The stack trace is captured when the record is built, before any unwinding.
 *
 * detected == false: an asserted invariant did not hold (ensure/require), or
 *                    the checked-call API was misused.
 * detected == true:  a delegated operation reported an error (check/inspect).
 */

#include <expected>
#include <optional>
#include <source_location>
#include <type_traits>
#include <utility>

#include "triage/error_id.hpp"
#include "triage/stack_trace.hpp"

namespace triage {

class failure {
public:
  failure(error_id original, stack_trace trace, bool detected, std::source_location where) noexcept
      : original_(std::move(original)), trace_(std::move(trace)), detected_(detected), where_(where) {}

  [[nodiscard]] auto original() const noexcept -> const error_id& { return original_; }
  [[nodiscard]] auto trace() const noexcept -> const stack_trace& { return trace_; }
  [[nodiscard]] bool detected() const noexcept { return detected_; }
  [[nodiscard]] auto where() const noexcept -> const std::source_location& { return where_; }

private:
  error_id original_;
  stack_trace trace_;
  bool detected_;
  std::source_location where_;
};

/** \brief A value or the failure that prevented it. */
template <typename T>
using outcome = std::expected<T, failure>;

namespace detail {

/** \brief Build a record for a failing call. A null error becomes errors::improper_use(). */
auto make_failure(const error_id& e, bool detected, std::source_location loc) -> failure;

[[noreturn]] void raise(failure f);

} // namespace detail

/** \brief Throw a failure (detected == false) when condition is false. */
void ensure(bool condition, const error_id& e, std::source_location loc = std::source_location::current());

/** \brief Throw a failure (detected == true) when err is engaged. */
void check(const std::optional<error_id>& err, std::source_location loc = std::source_location::current());

/** \brief Unwrap r, or throw its error as a failure (detected == true). */
template <typename T>
auto check(std::expected<T, error_id> r, std::source_location loc = std::source_location::current()) -> T {
  if (!r) detail::raise(detail::make_failure(r.error(), true, loc));
  if constexpr (!std::is_void_v<T>) return std::move(*r);
}

/** \brief ensure(), returned instead of thrown. */
[[nodiscard]] auto require(bool condition, const error_id& e,
                           std::source_location loc = std::source_location::current()) -> outcome<void>;

/** \brief check(), returned instead of thrown. */
[[nodiscard]] auto inspect(const std::optional<error_id>& err,
                           std::source_location loc = std::source_location::current()) -> outcome<void>;

template <typename T>
[[nodiscard]] auto inspect(std::expected<T, error_id> r,
                           std::source_location loc = std::source_location::current()) -> outcome<T> {
  if (!r) return std::unexpected(detail::make_failure(r.error(), true, loc));
  if constexpr (std::is_void_v<T>) {
    return {};
  } else {
    return std::move(*r);
  }
}

} // namespace triage

/**
 * \brief Propagate a failed outcome from the enclosing function, else yield its value.
 *
 * Evaluates expr once. The enclosing function must return an outcome<U>.
 */
#define TRIAGE_TRY(expr)                                                   \
  ({                                                                       \
    auto&& triage_result_ = (expr);                                        \
    if (!triage_result_.has_value()) [[unlikely]]                          \
      return std::unexpected(std::move(triage_result_.error()));           \
    std::move(*triage_result_);                                            \
  })

/** \brief TRIAGE_TRY for outcome<void>. */
#define TRIAGE_TRY_VOID(expr)                                              \
  do {                                                                     \
    auto&& triage_result_ = (expr);                                        \
    if (!triage_result_.has_value()) [[unlikely]]                          \
      return std::unexpected(std::move(triage_result_.error()));           \
  } while (false)
