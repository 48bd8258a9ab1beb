#include "triage/dispatcher.hpp"

#include <iostream>
#include <ostream>
#include <utility>

namespace triage {

dispatcher::dispatcher(std::shared_ptr<rule_book> book, dispatcher_options opts)
    : book_(book ? std::move(book) : std::make_shared<rule_book>()),
      opts_(std::move(opts)),
      writer_(std::make_shared<casefile_writer>()),
      sink_(writer_),
      diag_(&std::cerr) {
  if (opts_.casefile) writer_->set_destination(*opts_.casefile);
}

dispatcher::dispatcher(const dispatcher& o)
    : book_(o.book_),
      opts_(o.opts_),
      writer_(std::make_shared<casefile_writer>(*o.writer_)),
      sink_(o.sink_ == o.writer_ ? std::shared_ptr<diagnostic_sink>(writer_) : o.sink_),
      callback_(o.callback_),
      diag_(o.diag_) {}

dispatcher& dispatcher::operator=(const dispatcher& o) {
  if (this != &o) {
    dispatcher tmp(o);
    *this = std::move(tmp);
  }
  return *this;
}

void dispatcher::set_destination(std::filesystem::path p) {
  opts_.casefile = p;
  writer_->set_destination(std::move(p));
}

void dispatcher::set_sink(std::shared_ptr<diagnostic_sink> sink) {
  if (sink) {
    sink_ = std::move(sink);
  } else {
    sink_ = writer_;
  }
}

auto dispatcher::conclude(outcome<void> r, std::optional<error_id>& slot) -> std::optional<verdict> {
  if (r) return std::nullopt;
  auto v = settle(r.error(), false);
  slot = v.classified;
  return v;
}

auto dispatcher::settle(const failure& f, bool notify) -> verdict {
  const auto c = classify(f.original(), *book_, opts_.unmatched);
  auto where = sink_->record(f, c.result);
  if (!where) throw sink_fault(std::move(where.error()));
  if (!c.matched() && !opts_.quiet) report_unmatched(f);
  if (notify && callback_) callback_(f.detected(), c.result);
  return verdict{f, c.result, c.tier, std::move(*where)};
}

void dispatcher::report_unmatched(const failure& f) const {
  auto& os = *diag_;
  os << "[triage][dispatch] unclassified failure: " << f.original().message();
  if (!f.original().component().empty()) os << " [" << f.original().component() << "]";
  os << " at " << f.where().file_name() << ":" << f.where().line() << "\n";
  os << "STACK TRACE:\n" << f.trace().to_string() << std::flush;
}

} // namespace triage
