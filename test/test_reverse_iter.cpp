#include <moreiter/reverse_iter.hpp>

#include "helpers.hpp"

#include <forward_list>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

using moreitertest::InputIterable;
using moreitertest::to_vector;

using Vec = const std::vector<int>;

TEST_CASE("reverse_iter: yields the elements back to front",
    "[reverse_iter]") {
  Vec ns = {1, 2, 3, 4};
  REQUIRE(to_vector(moreiter::reverse_iter(ns)) == Vec{4, 3, 2, 1});
}

TEST_CASE("reverse_iter: refers to a reversible container", "[reverse_iter]") {
  std::vector<int> ns = {1, 2, 3};
  auto r = moreiter::reverse_iter(ns);
  ns[0] = 10;
  REQUIRE(to_vector(r) == Vec{3, 2, 10});
}

TEST_CASE("reverse_iter: forward-only sequence", "[reverse_iter]") {
  const std::forward_list<int> fl = {1, 2, 3};
  REQUIRE(to_vector(moreiter::reverse_iter(fl)) == Vec{3, 2, 1});
}

TEST_CASE("reverse_iter: single-pass sequence is read during the call",
    "[reverse_iter]") {
  InputIterable<int> in = {1, 2, 3};
  auto r = moreiter::reverse_iter(in);
  REQUIRE(in.position() == 3);
  REQUIRE(to_vector(r) == Vec{3, 2, 1});
}

TEST_CASE("reverse_iter: empty sequence", "[reverse_iter]") {
  Vec ns{};
  auto r = moreiter::reverse_iter(ns);
  REQUIRE(r.begin() == r.end());
}

TEST_CASE("reverse_iter: strings and temporaries", "[reverse_iter]") {
  const std::string s = "abc";
  REQUIRE(to_vector(moreiter::reverse_iter(s))
          == std::vector<char>{'c', 'b', 'a'});
  REQUIRE(to_vector(moreiter::reverse_iter(std::vector<int>{1, 2}))
          == Vec{2, 1});
}

TEST_CASE("reverse_iter: can be piped", "[reverse_iter]") {
  Vec ns = {1, 2};
  REQUIRE(to_vector(ns | moreiter::reverse_iter) == Vec{2, 1});
}
