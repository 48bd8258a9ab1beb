#pragma once

/** \file stack_trace.hpp
 *  \brief Call stack captured at the point of failure.
 *
 * Uses glibc backtrace()/backtrace_symbols(). Frames are symbolized eagerly so
 * the trace stays valid after the stack it was taken from has unwound.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace triage {

class stack_trace {
public:
  static constexpr std::size_t max_frames = 64;

  stack_trace() = default;

  /** \brief Capture the current stack, dropping the innermost `skip` frames. */
  [[nodiscard]] static auto capture(std::size_t skip = 0) -> stack_trace;

  [[nodiscard]] auto frames() const noexcept -> const std::vector<std::string>& { return frames_; }
  [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }

  /** \brief One frame per line, newline terminated. */
  [[nodiscard]] auto to_string() const -> std::string;

private:
  std::vector<std::string> frames_;
};

} // namespace triage
