#pragma once

/** \file config.hpp
 *  \brief Dispatcher options and their environment overrides.
 *
 * Environment:
 * - TRIAGE_CASEFILE   case-file destination path
 * - TRIAGE_UNMATCHED  "passthrough" | "unexpected"
 * - TRIAGE_QUIET      "1" suppresses the unclassified-failure diagnostic
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>

#include "triage/classify.hpp"
#include "triage/error.hpp"

namespace triage {

struct dispatcher_options {
  std::optional<std::filesystem::path> casefile;           /**< unset: temporary file per failure */
  unmatched_policy unmatched{unmatched_policy::passthrough};
  bool quiet{false};                                       /**< no diagnostic for unmatched failures */
};

[[nodiscard]] auto parse_unmatched_policy(std::string_view s) -> std::expected<unmatched_policy, core::error>;

/** \brief base with any TRIAGE_* variables applied; config_invalid on a bad value. */
[[nodiscard]] auto options_from_env(dispatcher_options base = {}) -> std::expected<dispatcher_options, core::error>;

} // namespace triage
