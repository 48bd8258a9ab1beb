#pragma once

/** \file casefile.hpp
 *  \brief Diagnostic sink: persists a classified failure record.
 *
 * Case-file format:
 *   FAILURE: <original error message>\n
 *   STACK TRACE:\n
 *   <trace, one frame per line>\n
 *
 * Destination policy of casefile_writer:
 * - configured path: any existing file there is removed, then the file is created
 * - otherwise, or when that fails: a fresh temporary file "triage-XXXXXX" in
 *   std::filesystem::temp_directory_path()
 * - neither works: io_failed, which the dispatcher treats as fatal
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "triage/error.hpp"
#include "triage/error_id.hpp"
#include "triage/failure.hpp"

namespace triage {

/** \brief Receives each failure the dispatcher recovers. */
class diagnostic_sink {
public:
  virtual ~diagnostic_sink() = default;

  /** \brief Persist the record; returns where it went. */
  virtual auto record(const failure& f, const error_id& classified)
      -> std::expected<std::filesystem::path, core::error> = 0;
};

/** \brief Render a record in case-file format. */
[[nodiscard]] auto format_casefile(const failure& f) -> std::string;

class casefile_writer final : public diagnostic_sink {
public:
  casefile_writer() = default;
  explicit casefile_writer(std::filesystem::path destination) : destination_(std::move(destination)) {}

  void set_destination(std::filesystem::path p) { destination_ = std::move(p); }
  void clear_destination() { destination_.reset(); }
  [[nodiscard]] auto destination() const noexcept -> const std::optional<std::filesystem::path>& { return destination_; }

  /** \brief Directory for fallback temporary files; defaults to the system temp directory. */
  void set_temp_directory(std::filesystem::path dir) { temp_dir_ = std::move(dir); }

  auto record(const failure& f, const error_id& classified)
      -> std::expected<std::filesystem::path, core::error> override;

private:
  auto write_to(const std::filesystem::path& p, const std::string& body) -> std::expected<void, core::error>;
  auto write_temp(const std::string& body) -> std::expected<std::filesystem::path, core::error>;

  std::optional<std::filesystem::path> destination_;
  std::optional<std::filesystem::path> temp_dir_;
};

} // namespace triage
