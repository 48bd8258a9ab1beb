#include <catch2/catch_test_macros.hpp>
#include <triage/dispatcher.hpp>

#include <filesystem>
#include <optional>
#include <utility>

using namespace triage;

namespace {

const error_id& short_read() {
  static const auto e = make_error("io: short read", "storage");
  return e;
}

auto read_block(int n) -> outcome<int> {
  TRIAGE_TRY_VOID(require(n >= 0, make_error("negative block")));
  TRIAGE_TRY_VOID(inspect(n == 7 ? std::optional<error_id>{short_read()} : std::nullopt));
  return n * 512;
}

auto read_two(int a, int b) -> outcome<int> {
  const int x = TRIAGE_TRY(read_block(a));
  const int y = TRIAGE_TRY(read_block(b));
  return x + y;
}

struct temp_dir {
  std::filesystem::path path;
  temp_dir() : path(std::filesystem::temp_directory_path() / "triage_outcome_test") {
    std::error_code ec; std::filesystem::remove_all(path, ec); std::filesystem::create_directories(path, ec);
  }
  ~temp_dir() { std::error_code ec; std::filesystem::remove_all(path, ec); }
};

} // namespace

TEST_CASE("TRIAGE_TRY propagates the first failure", "[outcome]") {
  auto ok = read_two(1, 2);
  REQUIRE(ok.has_value());
  REQUIRE(*ok == 1536);

  auto bad = read_two(7, -1);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().original() == short_read());
  REQUIRE(bad.error().detected());
}

TEST_CASE("conclude classifies a failed outcome", "[outcome][dispatcher]") {
  temp_dir tmp;
  auto book = std::make_shared<rule_book>();
  auto io = make_error("io");
  book->register_prefix("io:", io);

  dispatcher d(book, dispatcher_options{.casefile = tmp.path / "case.txt"});
  int calls = 0;
  d.set_callback([&](bool, const error_id&) { ++calls; });

  auto r = d.conclude(read_two(1, 7));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error() == io);
  REQUIRE(calls == 0);
  REQUIRE(std::filesystem::exists(tmp.path / "case.txt"));

  auto fine = d.conclude(read_two(1, 1));
  REQUIRE(fine.has_value());
  REQUIRE(*fine == 1024);
}

TEST_CASE("conclude into a slot", "[outcome][dispatcher]") {
  temp_dir tmp;
  auto book = std::make_shared<rule_book>();
  auto neg = make_error("negative block");
  auto invalid = make_error("invalid request");
  book->set_fallback(invalid);

  dispatcher d(book, dispatcher_options{.casefile = tmp.path / "case.txt"});
  std::optional<error_id> slot;

  REQUIRE_FALSE(d.conclude(require(true, neg), slot).has_value());
  REQUIRE_FALSE(slot.has_value());

  auto v = d.conclude(require(false, neg), slot);
  REQUIRE(v.has_value());
  REQUIRE(slot.has_value());
  REQUIRE(*slot == invalid);
  REQUIRE(v->tier == match_tier::fallback);
  REQUIRE_FALSE(v->record.detected());
}

TEST_CASE("dispatch reports a returned failure through the callback", "[outcome][dispatcher]") {
  temp_dir tmp;
  auto book = std::make_shared<rule_book>();
  book->register_exact(short_read());
  dispatcher d(book, dispatcher_options{.casefile = tmp.path / "case.txt"});

  std::optional<std::pair<bool, error_id>> seen;
  d.set_callback([&](bool detected, const error_id& e) { seen.emplace(detected, e); });

  auto r = read_two(7, 1);
  REQUIRE_FALSE(r.has_value());
  auto v = d.dispatch(r.error());
  REQUIRE(v.classified == short_read());
  REQUIRE(seen.has_value());
  REQUIRE(seen->first);
  REQUIRE(seen->second == short_read());
}
