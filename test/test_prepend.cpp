#include <moreiter/prepend.hpp>

#include "helpers.hpp"

#include <string>
#include <vector>

#include <catch2/catch.hpp>

using moreitertest::InputIterable;
using moreitertest::to_vector;

using Vec = const std::vector<int>;

TEST_CASE("prepend: value comes before the sequence", "[prepend]") {
  Vec ns = {10, 11, 12};
  REQUIRE(to_vector(moreiter::prepend(1, ns)) == Vec{1, 10, 11, 12});
}

TEST_CASE("prepend: empty sequence yields the value", "[prepend]") {
  Vec ns{};
  REQUIRE(to_vector(moreiter::prepend(3, ns)) == Vec{3});
}

TEST_CASE("prepend: value is converted to the element type", "[prepend]") {
  const std::vector<long> ls = {2L};
  auto p = to_vector(moreiter::prepend(1, ls));
  REQUIRE(p == std::vector<long>{1L, 2L});

  const std::string s = "bc";
  auto cs = to_vector(moreiter::prepend('a', s));
  REQUIRE(std::string(cs.begin(), cs.end()) == "abc");
}

TEST_CASE("prepend: single-pass sequence is not read early", "[prepend]") {
  InputIterable<int> in = {2, 3};
  auto p = moreiter::prepend(1, in);
  auto it = p.begin();
  REQUIRE(*it == 1);
  REQUIRE(in.reads() == 0);
  REQUIRE(to_vector(p) == Vec{1, 2, 3});
}

TEST_CASE("prepend: strings", "[prepend]") {
  const std::vector<std::string> strs = {"b"};
  REQUIRE(to_vector(moreiter::prepend("a", strs))
          == std::vector<std::string>{"a", "b"});
}

TEST_CASE("append: value comes after the sequence", "[append]") {
  Vec ns = {1, 2, 3};
  REQUIRE(to_vector(moreiter::append(ns, 0)) == Vec{1, 2, 3, 0});
}

TEST_CASE("append: empty sequence yields the value", "[append]") {
  Vec ns{};
  REQUIRE(to_vector(moreiter::append(ns, 4)) == Vec{4});
}

TEST_CASE("append: single-pass sequence and temporaries", "[append]") {
  InputIterable<int> in = {1, 2};
  REQUIRE(to_vector(moreiter::append(in, 3)) == Vec{1, 2, 3});
  REQUIRE(to_vector(moreiter::append(std::vector<std::string>{"x"}, "y"))
          == std::vector<std::string>{"x", "y"});
}
