#include "triage/error_id.hpp"

namespace triage {

auto error_id::message() const noexcept -> std::string_view {
  return state_ ? std::string_view(state_->message) : std::string_view{};
}

auto error_id::component() const noexcept -> std::string_view {
  return state_ ? std::string_view(state_->component) : std::string_view{};
}

auto make_error(std::string message, std::string component) -> error_id {
  return error_id(std::make_shared<const error_id::state>(
      error_id::state{std::move(message), std::move(component)}));
}

namespace errors {

auto improper_use() -> const error_id& {
  static const error_id e = make_error("improper use of checked call: null error", "triage");
  return e;
}

auto unexpected() -> const error_id& {
  static const error_id e = make_error("unexpected error", "triage");
  return e;
}

} // namespace errors

} // namespace triage
