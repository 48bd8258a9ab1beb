#include <catch2/catch_test_macros.hpp>
#include <triage/error_id.hpp>

#include <unordered_set>

using triage::error_id;
using triage::make_error;

TEST_CASE("error identity is per make_error call", "[error_id]") {
  auto a = make_error("disk full", "storage");
  auto b = make_error("disk full", "storage");
  auto a2 = a;

  REQUIRE(a == a2);
  REQUIRE_FALSE(a == b);
  REQUIRE(a.message() == "disk full");
  REQUIRE(a.component() == "storage");
}

TEST_CASE("null identity", "[error_id]") {
  error_id n;
  REQUIRE(n.is_null());
  REQUIRE_FALSE(static_cast<bool>(n));
  REQUIRE(n.message().empty());
  REQUIRE(n == error_id{});
  REQUIRE_FALSE(n == make_error(""));
}

TEST_CASE("hash follows identity", "[error_id]") {
  auto a = make_error("x");
  auto b = make_error("x");
  std::unordered_set<error_id> s{a, b, a};
  REQUIRE(s.size() == 2);
  REQUIRE(s.contains(a));
}

TEST_CASE("library identities are stable", "[error_id]") {
  REQUIRE(triage::errors::improper_use() == triage::errors::improper_use());
  REQUIRE(triage::errors::unexpected() == triage::errors::unexpected());
  REQUIRE_FALSE(triage::errors::improper_use() == triage::errors::unexpected());
  REQUIRE(triage::errors::improper_use().component() == "triage");
}
