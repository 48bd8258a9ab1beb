#include <catch2/catch_test_macros.hpp>
#include <triage/rule_book.hpp>

using namespace triage;

TEST_CASE("registration counts and overwrite", "[rules]") {
  rule_book book;
  auto e1 = make_error("e1");
  auto e2 = make_error("e2");
  auto e3 = make_error("e3");

  book.register_exact(e1);
  book.register_exact(e1);
  REQUIRE(book.exact_count() == 1);

  book.register_mapping(e1, e2);
  book.register_mapping(e1, e3);
  REQUIRE(book.mapping_count() == 1);
  auto target = book.read([&](const rule_set& r) { return r.mappings.at(e1); });
  REQUIRE(target == e3);

  REQUIRE_FALSE(book.has_fallback());
  book.set_fallback(e2);
  book.set_fallback(e3);
  REQUIRE(book.has_fallback());
  REQUIRE(book.read([](const rule_set& r) { return *r.fallback; }) == e3);
  book.clear_fallback();
  REQUIRE_FALSE(book.has_fallback());
}

TEST_CASE("re-registered pattern keeps its position", "[rules]") {
  rule_book book;
  auto a = make_error("a");
  auto b = make_error("b");
  auto c = make_error("c");
  book.register_prefix("disk:", a);
  book.register_prefix("net:", b);
  book.register_prefix("disk:", c);

  REQUIRE(book.pattern_count() == 2);
  book.read([&](const rule_set& r) {
    REQUIRE(r.patterns[0].text == "disk:");
    REQUIRE(r.patterns[0].target == c);
    REQUIRE(r.patterns[1].text == "net:");
  });
}

TEST_CASE("prefix and regex with the same text are distinct rules", "[rules]") {
  rule_book book;
  auto a = make_error("a");
  book.register_prefix("disk", a);
  REQUIRE(book.register_regex("disk", a).has_value());
  REQUIRE(book.pattern_count() == 2);
}

TEST_CASE("malformed regex is rejected and leaves the book unchanged", "[rules]") {
  rule_book book;
  auto r = book.register_regex("disk[", make_error("x"));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::invalid_argument);
  REQUIRE(r.error().component == "triage.rules");
  REQUIRE(book.pattern_count() == 0);
}

TEST_CASE("register_pattern follows the default kind", "[rules]") {
  auto e = make_error("e");

  rule_book prefix_book;
  REQUIRE(prefix_book.register_pattern("a.c", e).has_value());
  prefix_book.read([](const rule_set& r) {
    REQUIRE(r.patterns[0].kind == pattern_kind::prefix);
    REQUIRE(r.patterns[0].matches("a.c and more"));
    REQUIRE_FALSE(r.patterns[0].matches("abc"));
  });

  rule_book regex_book(pattern_kind::regex);
  REQUIRE(regex_book.register_pattern("a.c", e).has_value());
  regex_book.read([](const rule_set& r) {
    REQUIRE(r.patterns[0].kind == pattern_kind::regex);
    REQUIRE(r.patterns[0].matches("xx abc"));
  });
  REQUIRE_FALSE(regex_book.register_pattern("(", e).has_value());
}

TEST_CASE("clear drops every tier", "[rules]") {
  rule_book book;
  auto e = make_error("e");
  book.register_exact(e);
  book.register_mapping(e, e);
  book.register_prefix("p", e);
  book.set_fallback(e);
  book.clear();
  REQUIRE(book.exact_count() == 0);
  REQUIRE(book.mapping_count() == 0);
  REQUIRE(book.pattern_count() == 0);
  REQUIRE_FALSE(book.has_fallback());
}
