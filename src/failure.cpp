#include "triage/failure.hpp"

namespace triage {

namespace detail {

auto make_failure(const error_id& e, bool detected, std::source_location loc) -> failure {
  // Skip make_failure itself; the checking call stays as the innermost frame.
  auto trace = stack_trace::capture(1);
  if (!e) return failure(errors::improper_use(), std::move(trace), false, loc);
  return failure(e, std::move(trace), detected, loc);
}

void raise(failure f) {
  throw f;
}

} // namespace detail

void ensure(bool condition, const error_id& e, std::source_location loc) {
  if (!condition) detail::raise(detail::make_failure(e, false, loc));
}

void check(const std::optional<error_id>& err, std::source_location loc) {
  if (err) detail::raise(detail::make_failure(*err, true, loc));
}

auto require(bool condition, const error_id& e, std::source_location loc) -> outcome<void> {
  if (!condition) return std::unexpected(detail::make_failure(e, false, loc));
  return {};
}

auto inspect(const std::optional<error_id>& err, std::source_location loc) -> outcome<void> {
  if (err) return std::unexpected(detail::make_failure(*err, true, loc));
  return {};
}

} // namespace triage
