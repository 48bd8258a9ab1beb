#include "triage/stack_trace.hpp"

#include <array>
#include <cstdlib>

#include <execinfo.h>

namespace triage {

auto stack_trace::capture(std::size_t skip) -> stack_trace {
  std::array<void*, max_frames> addrs{};
  const int n = ::backtrace(addrs.data(), static_cast<int>(addrs.size()));
  stack_trace t;
  if (n <= 0) return t;
  char** symbols = ::backtrace_symbols(addrs.data(), n);
  // +1 drops capture() itself.
  const std::size_t first = skip + 1;
  for (std::size_t i = first; i < static_cast<std::size_t>(n); ++i) {
    t.frames_.emplace_back(symbols ? symbols[i] : "??");
  }
  std::free(symbols);
  return t;
}

auto stack_trace::to_string() const -> std::string {
  std::string out;
  for (std::size_t i = 0; i < frames_.size(); ++i) {
    out += '#';
    out += std::to_string(i);
    out += ' ';
    out += frames_[i];
    out += '\n';
  }
  return out;
}

} // namespace triage
