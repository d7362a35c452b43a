#include <moreiter/partition.hpp>

#include "helpers.hpp"

#include <string>
#include <vector>

#include <catch2/catch.hpp>

using moreitertest::InputIterable;
using moreitertest::to_vector;

using Vec = const std::vector<int>;

TEST_CASE("partition: elements that hold come first", "[partition]") {
  Vec ns = {0, 1, 2, 3, 4, 5};
  auto parts = moreiter::partition([](int i) { return i >= 3; }, ns);
  REQUIRE(to_vector(parts.first) == Vec{3, 4, 5});
  REQUIRE(to_vector(parts.second) == Vec{0, 1, 2});
}

TEST_CASE("partition: structured bindings", "[partition]") {
  Vec ns = {1, 2, 3, 4};
  auto [evens, odds] =
      moreiter::partition([](int i) { return i % 2 == 0; }, ns);
  REQUIRE(to_vector(odds) == Vec{1, 3});
  REQUIRE(to_vector(evens) == Vec{2, 4});
}

TEST_CASE("partition: single-pass source is read once", "[partition]") {
  InputIterable<int> in = {0, 1, 2, 3, 4, 5};
  auto parts = moreiter::partition([](int i) { return i % 2 == 0; }, in);
  REQUIRE(in.position() == 0);
  REQUIRE(to_vector(parts.second) == Vec{1, 3, 5});
  REQUIRE(to_vector(parts.first) == Vec{0, 2, 4});
  REQUIRE(in.position() == 6);
  REQUIRE(in.reads() == 6);
}

TEST_CASE("partition: nullptr tests the element", "[partition]") {
  Vec ns = {0, 1, 0, 2};
  auto parts = moreiter::partition(nullptr, ns);
  REQUIRE(to_vector(parts.first) == Vec{1, 2});
  REQUIRE(to_vector(parts.second) == Vec{0, 0});
}

TEST_CASE("partition: owns a temporary source", "[partition]") {
  auto parts = moreiter::partition(
      [](const std::string& s) { return s.size() > 1; },
      std::vector<std::string>{"a", "bb", "c", "dd"});
  REQUIRE(to_vector(parts.first) == std::vector<std::string>{"bb", "dd"});
  REQUIRE(to_vector(parts.second) == std::vector<std::string>{"a", "c"});
}

TEST_CASE("partition: empty source", "[partition]") {
  Vec ns{};
  auto parts = moreiter::partition([](int i) { return i > 0; }, ns);
  REQUIRE(to_vector(parts.first).empty());
  REQUIRE(to_vector(parts.second).empty());
}
