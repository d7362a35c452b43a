#include <moreiter/head.hpp>
#include <moreiter/length.hpp>

#include "helpers.hpp"

#include <forward_list>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

using moreitertest::InputIterable;

TEST_CASE("length: sized containers", "[length]") {
  const std::vector<int> ns = {1, 2, 3};
  REQUIRE(moreiter::length(ns) == 3);
  int arr[] = {1, 2, 3, 4};
  REQUIRE(moreiter::length(arr) == 4);
  const std::string s = "hello";
  REQUIRE(moreiter::length(s) == 5);
  REQUIRE(moreiter::length(std::vector<int>{}) == 0);
}

TEST_CASE("length: sequences without a size are counted", "[length]") {
  const std::forward_list<int> fl = {1, 2, 3};
  REQUIRE(moreiter::length(fl) == 3);

  const std::vector<int> ns = {1, 2, 3, 4};
  REQUIRE(moreiter::length(moreiter::head(ns, 2)) == 2);
}

TEST_CASE("length: consumes a single-pass sequence", "[length]") {
  InputIterable<int> in = {1, 2, 3};
  REQUIRE(moreiter::length(in) == 3);
  REQUIRE(in.position() == 3);
  REQUIRE(in.reads() == 0);
  REQUIRE(moreiter::length(in) == 0);
}

TEST_CASE("length: can be piped", "[length]") {
  const std::vector<int> ns = {1, 2};
  REQUIRE((ns | moreiter::length) == 2);
}
