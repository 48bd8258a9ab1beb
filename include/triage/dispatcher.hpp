#pragma once

/** \file dispatcher.hpp
 *  \brief Recovery point for one guarded call chain.
 *
 * guard(fn) runs fn. Every way out of fn passes the dispatcher:
 * - normal return: nothing happens, guard returns std::nullopt
 * - triage::failure: classified against the dispatcher's rule_book, written
 *   to the sink, reported to the callback; the failure stops here
 * - any other exception: rethrown untouched
 *
 * guard_into() and conclude() convert the recovered failure back into an
 * ordinary error value instead of calling the callback.
 *
 * A sink that cannot persist the record raises sink_fault. That is fatal to
 * the dispatch and is never classified.
 */

#include <expected>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <utility>

#include "triage/casefile.hpp"
#include "triage/classify.hpp"
#include "triage/config.hpp"
#include "triage/error.hpp"
#include "triage/failure.hpp"
#include "triage/rule_book.hpp"
#include "triage/scope.hpp"

namespace triage {

using failure_callback = std::function<void(bool detected, const error_id& classified)>;

/** \brief What the dispatcher did with one failure. */
struct verdict {
  failure record;
  error_id classified;
  match_tier tier{match_tier::unmatched};
  std::filesystem::path casefile;
};

class sink_fault : public std::runtime_error {
public:
  explicit sink_fault(core::error e)
      : std::runtime_error("triage: diagnostic sink failed: " + e.message), error_(std::move(e)) {}

  [[nodiscard]] auto error() const noexcept -> const core::error& { return error_; }

private:
  core::error error_;
};

class dispatcher {
public:
  explicit dispatcher(std::shared_ptr<rule_book> book, dispatcher_options opts = {});

  /** \brief Copies share the rule_book but get their own case-file writer. */
  dispatcher(const dispatcher& o);
  dispatcher& operator=(const dispatcher& o);
  dispatcher(dispatcher&&) noexcept = default;
  dispatcher& operator=(dispatcher&&) = default;

  /** \brief Dispatcher bound to the caller's scope in the process-wide table. */
  [[nodiscard]] static auto here(dispatcher_options opts = {},
                                 std::source_location loc = std::source_location::current()) -> dispatcher {
    return dispatcher(scope_table::global().resolve_here(loc), std::move(opts));
  }

  void set_destination(std::filesystem::path p);
  void set_callback(failure_callback fn) { callback_ = std::move(fn); }
  /** \brief Replace the case-file writer; null restores it. */
  void set_sink(std::shared_ptr<diagnostic_sink> sink);
  void set_diagnostics(std::ostream& os) noexcept { diag_ = &os; }
  void set_unmatched_policy(unmatched_policy p) noexcept { opts_.unmatched = p; }
  void set_quiet(bool q) noexcept { opts_.quiet = q; }

  [[nodiscard]] auto rules() const noexcept -> const std::shared_ptr<rule_book>& { return book_; }
  [[nodiscard]] auto options() const noexcept -> const dispatcher_options& { return opts_; }

  template <typename Fn>
  auto guard(Fn&& fn) -> std::optional<verdict> {
    try {
      std::invoke(std::forward<Fn>(fn));
    } catch (const failure& f) {
      return dispatch(f);
    }
    return std::nullopt;
  }

  /** \brief guard(), but the classified error lands in slot and the callback is not called. */
  template <typename Fn>
  auto guard_into(Fn&& fn, std::optional<error_id>& slot) -> std::optional<verdict> {
    try {
      std::invoke(std::forward<Fn>(fn));
    } catch (const failure& f) {
      auto v = settle(f, false);
      slot = v.classified;
      return v;
    }
    return std::nullopt;
  }

  /** \brief Top of a result-propagated chain: a value, or the classified error. */
  template <typename T>
  auto conclude(outcome<T> r) -> std::expected<T, error_id> {
    if (!r) return std::unexpected(settle(r.error(), false).classified);
    if constexpr (std::is_void_v<T>) {
      return {};
    } else {
      return std::move(*r);
    }
  }

  auto conclude(outcome<void> r, std::optional<error_id>& slot) -> std::optional<verdict>;

  /** \brief Classify, record and report one failure, calling the callback. */
  auto dispatch(const failure& f) -> verdict { return settle(f, true); }

private:
  auto settle(const failure& f, bool notify) -> verdict;
  void report_unmatched(const failure& f) const;

  std::shared_ptr<rule_book> book_;
  dispatcher_options opts_;
  std::shared_ptr<casefile_writer> writer_;
  std::shared_ptr<diagnostic_sink> sink_;
  failure_callback callback_;
  std::ostream* diag_;
};

} // namespace triage
