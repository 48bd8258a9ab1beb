#include <catch2/catch_test_macros.hpp>
#include <triage/scope.hpp>

#include <string>

using namespace triage;

namespace {
auto resolve_from_helper(scope_table& t) { return t.resolve_here(); }
}

TEST_CASE("resolve is idempotent per key", "[scope]") {
  scope_table table;
  auto a = table.resolve("storage");
  auto b = table.resolve("storage");
  REQUIRE(a == b);

  auto e = make_error("e");
  a->register_exact(e);
  REQUIRE(b->exact_count() == 1);
  REQUIRE(table.size() == 1);
}

TEST_CASE("different keys get independent books", "[scope]") {
  scope_table table;
  auto a = table.resolve("storage");
  auto b = table.resolve("network");
  REQUIRE(a != b);
  a->register_exact(make_error("e"));
  REQUIRE(b->exact_count() == 0);
}

TEST_CASE("call sites in one file share a book", "[scope]") {
  scope_table table;
  auto here = table.resolve_here();
  auto helper = resolve_from_helper(table);
  REQUIRE(here == helper);
  REQUIRE(table.contains(__FILE__));
  REQUIRE(table.contains(scope_table::scope_key(std::source_location::current())));
}

TEST_CASE("books are created lazily with the table's pattern kind", "[scope]") {
  scope_table table(pattern_kind::regex);
  REQUIRE_FALSE(table.contains("lazy"));
  auto book = table.resolve("lazy");
  REQUIRE(table.contains("lazy"));
  REQUIRE(book->default_kind() == pattern_kind::regex);
}

TEST_CASE("global table and rules_here agree", "[scope]") {
  auto a = rules_here();
  auto b = scope_table::global().resolve(__FILE__);
  REQUIRE(a == b);
}
