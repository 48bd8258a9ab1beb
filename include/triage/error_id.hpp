#pragma once

/** \file error_id.hpp
 *  \brief Opaque error identity classified by triage.
 *
 * An error_id is a cheap handle. Every make_error() call mints a new identity;
 * copies of a handle share it. Equality and hashing use the identity only:
 * two errors with the same message are still different errors.
 *
 * A default-constructed error_id is the null identity.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace triage {

class error_id;

/** \brief Mint a new error identity. */
auto make_error(std::string message, std::string component = {}) -> error_id;

class error_id {
public:
  error_id() = default;

  /** \brief Message text; empty for the null identity. */
  [[nodiscard]] auto message() const noexcept -> std::string_view;

  /** \brief Originating component, e.g. "storage.disk"; may be empty. */
  [[nodiscard]] auto component() const noexcept -> std::string_view;

  [[nodiscard]] bool is_null() const noexcept { return state_ == nullptr; }
  explicit operator bool() const noexcept { return state_ != nullptr; }

  /** \brief Address-like key of the identity; nullptr for the null identity. */
  [[nodiscard]] auto key() const noexcept -> const void* { return state_.get(); }

  friend bool operator==(const error_id& a, const error_id& b) noexcept { return a.state_ == b.state_; }

  friend auto make_error(std::string message, std::string component) -> error_id;

private:
  struct state {
    std::string message;
    std::string component;
  };

  explicit error_id(std::shared_ptr<const state> s) noexcept : state_(std::move(s)) {}

  std::shared_ptr<const state> state_;
};

/** \brief Identities owned by the library. Each call returns the same identity. */
namespace errors {

/** Checked-call API used incorrectly (a null error passed as a failure). */
auto improper_use() -> const error_id&;

/** Reported for unmatched failures under unmatched_policy::unexpected. */
auto unexpected() -> const error_id&;

} // namespace errors

} // namespace triage

template <>
struct std::hash<triage::error_id> {
  auto operator()(const triage::error_id& e) const noexcept -> std::size_t {
    return std::hash<const void*>{}(e.key());
  }
};
