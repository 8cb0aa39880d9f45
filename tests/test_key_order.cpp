#include "transfmt/domain/key_order.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace transfmt::domain;

TEST_CASE("compare_keys orders by key prefix", "[domain][key_order]") {
  CHECK(compare_keys("a=1", "b=1") < 0);
  CHECK(compare_keys("b=1", "a=1") > 0);
  CHECK(compare_keys("same=1", "same=2") == 0);
}

TEST_CASE("compare_keys ignores ASCII case", "[domain][key_order]") {
  CHECK(compare_keys("Key=1", "key=2") == 0);
  CHECK(compare_keys("ABC=x", "abd=x") < 0);
}

TEST_CASE("compare_keys stops at space, tab or equals", "[domain][key_order]") {
  CHECK(compare_keys("a b=1", "a=1") == 0);
  CHECK(compare_keys("a\t=1", "a =1") == 0);

  // The side whose key ends first sorts first.
  CHECK(compare_keys("a=1", "ab=1") < 0);
  CHECK(compare_keys("ab=1", "a=1") > 0);
}

TEST_CASE("compare_keys reads past an escaped equals", "[domain][key_order]") {
  CHECK(compare_keys(R"(a\=b=1)", R"(a\=c=2)") < 0);
  CHECK(compare_keys(R"(a\=c=2)", R"(a\=b=1)") > 0);
  CHECK(compare_keys(R"(a\=b=1)", R"(a\=b=2)") == 0);
  CHECK(compare_keys(R"(a\=b=1)", "a=1") > 0);

  // An even run of backslashes leaves the '=' unescaped.
  CHECK(compare_keys(R"(a\\=x)", R"(a\\=y)") == 0);
}

TEST_CASE("compare_keys falls back to length when a line runs out", "[domain][key_order]") {
  CHECK(compare_keys("ab", "abc") < 0);
  CHECK(compare_keys("abc", "ab") > 0);
  CHECK(compare_keys("abc", "abc") == 0);
  CHECK(compare_keys("", "") == 0);
  CHECK(compare_keys("", "a") < 0);
}

TEST_CASE("compare_keys compares lower-cased after upper-casing differs",
          "[domain][key_order]") {
  // '_' lies between 'Z' and 'a': upper-casing alone would put it after letters.
  CHECK(compare_keys("_=1", "a=1") < 0);
  CHECK(compare_keys("_=1", "A=1") < 0);
  CHECK(compare_keys("a=1", "_=1") > 0);
}

TEST_CASE("stable sort with KeyOrder keeps same-key lines in input order",
          "[domain][key_order]") {
  std::vector<std::string> lines = {"b=1", "A=2", "a=1", "B=0", "a=3"};
  std::stable_sort(lines.begin(), lines.end(), KeyOrder{});

  const std::vector<std::string> expected = {"A=2", "a=1", "a=3", "b=1", "B=0"};
  REQUIRE(lines == expected);
}

TEST_CASE("same_key is case-sensitive", "[domain][key_order]") {
  CHECK(same_key("key", "key"));
  CHECK_FALSE(same_key("Key", "key"));
  CHECK(compare_keys("Key", "key") == 0);
}
