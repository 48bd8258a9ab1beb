#include "triage/casefile.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#include <stdlib.h>
#include <unistd.h>

namespace triage {

auto format_casefile(const failure& f) -> std::string {
  std::string out = "FAILURE: ";
  out += f.original().message();
  out += "\nSTACK TRACE:\n";
  out += f.trace().to_string();
  out += '\n';
  return out;
}

auto casefile_writer::record(const failure& f, const error_id& /*classified*/)
    -> std::expected<std::filesystem::path, core::error> {
  const auto body = format_casefile(f);
  // An unusable destination falls back to a temporary file.
  if (destination_ && write_to(*destination_, body).has_value()) return *destination_;
  return write_temp(body);
}

auto casefile_writer::write_to(const std::filesystem::path& p, const std::string& body)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "casefile remove failed: " + ec.message(), "triage.casefile"});
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out.good()) return std::unexpected(error{error_code::io_failed, "casefile open failed", "triage.casefile"});
  out << body;
  out.flush();
  if (!out.good()) return std::unexpected(error{error_code::io_failed, "casefile write failed", "triage.casefile"});
  return {};
}

auto casefile_writer::write_temp(const std::string& body) -> std::expected<std::filesystem::path, core::error> {
  using core::error; using core::error_code;
  std::filesystem::path dir;
  if (temp_dir_) {
    dir = *temp_dir_;
  } else {
    std::error_code ec;
    dir = std::filesystem::temp_directory_path(ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "no temp directory: " + ec.message(), "triage.casefile"});
  }
  std::string templ = (dir / "triage-XXXXXX").string();
  const int fd = ::mkstemp(templ.data());
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed,
                                 std::string("temp casefile create failed: ") + std::strerror(errno), "triage.casefile"});
  }
  const char* p = body.data();
  std::size_t left = body.size();
  while (left > 0) {
    const ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int saved = errno;
      (void)::close(fd);
      return std::unexpected(error{error_code::io_failed,
                                   std::string("temp casefile write failed: ") + std::strerror(saved), "triage.casefile"});
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0) {
    return std::unexpected(error{error_code::io_failed, "temp casefile close failed", "triage.casefile"});
  }
  return std::filesystem::path(templ);
}

} // namespace triage
