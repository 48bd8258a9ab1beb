#include "triage/config.hpp"

#include <string>

#include "triage/core/platform_utils.hpp"

namespace triage {

auto parse_unmatched_policy(std::string_view s) -> std::expected<unmatched_policy, core::error> {
  using core::error; using core::error_code;
  if (s == "passthrough") return unmatched_policy::passthrough;
  if (s == "unexpected") return unmatched_policy::unexpected;
  return std::unexpected(error{error_code::config_invalid,
                               "unknown unmatched policy '" + std::string(s) + "'", "triage.config"});
}

auto options_from_env(dispatcher_options base) -> std::expected<dispatcher_options, core::error> {
  if (auto v = core::safe_getenv("TRIAGE_CASEFILE"); v && !v->empty()) {
    base.casefile = std::filesystem::path(*v);
  }
  if (auto v = core::safe_getenv("TRIAGE_UNMATCHED"); v && !v->empty()) {
    auto policy = parse_unmatched_policy(*v);
    if (!policy) return std::unexpected(std::move(policy.error()));
    base.unmatched = *policy;
  }
  if (core::env_flag("TRIAGE_QUIET")) base.quiet = true;
  return base;
}

} // namespace triage
