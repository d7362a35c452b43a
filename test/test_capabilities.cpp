#include <moreiter/capabilities.hpp>
#include <moreiter/head.hpp>
#include <moreiter/partition.hpp>
#include <moreiter/reverse_iter.hpp>

#include "helpers.hpp"

#include <deque>
#include <forward_list>
#include <list>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

using moreitertest::InputIterable;
using moreitertest::ReversibleUnsized;
using moreitertest::SizedForwardList;

TEST_CASE("capabilities: random access containers have every capability",
    "[capabilities]") {
  STATIC_REQUIRE(moreiter::has_length_v<std::vector<int>>);
  STATIC_REQUIRE(moreiter::is_reversible_v<std::vector<int>>);
  STATIC_REQUIRE(moreiter::is_indexable_v<std::vector<int>>);
  STATIC_REQUIRE(moreiter::is_reusable_v<std::vector<int>>);

  STATIC_REQUIRE(moreiter::has_length_v<std::deque<int>>);
  STATIC_REQUIRE(moreiter::is_reversible_v<std::deque<int>>);
  STATIC_REQUIRE(moreiter::is_indexable_v<std::deque<int>>);

  STATIC_REQUIRE(moreiter::has_length_v<std::string>);
  STATIC_REQUIRE(moreiter::is_reversible_v<std::string>);
  STATIC_REQUIRE(moreiter::is_indexable_v<std::string>);
}

TEST_CASE("capabilities: C arrays have every capability", "[capabilities]") {
  using Array = int[3];
  STATIC_REQUIRE(moreiter::has_length_v<Array>);
  STATIC_REQUIRE(moreiter::is_reversible_v<Array>);
  STATIC_REQUIRE(moreiter::is_indexable_v<Array>);
  STATIC_REQUIRE(moreiter::is_reusable_v<Array&>);
}

TEST_CASE("capabilities: std::list is sized and reversible only",
    "[capabilities]") {
  STATIC_REQUIRE(moreiter::has_length_v<std::list<int>>);
  STATIC_REQUIRE(moreiter::is_reversible_v<std::list<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_indexable_v<std::list<int>>);
}

TEST_CASE("capabilities: std::forward_list has none of the three",
    "[capabilities]") {
  STATIC_REQUIRE_FALSE(moreiter::has_length_v<std::forward_list<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_reversible_v<std::forward_list<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_indexable_v<std::forward_list<int>>);
  STATIC_REQUIRE(moreiter::is_reusable_v<std::forward_list<int>>);
}

TEST_CASE("capabilities: each capability is detected independently",
    "[capabilities]") {
  STATIC_REQUIRE(moreiter::has_length_v<SizedForwardList<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_reversible_v<SizedForwardList<int>>);

  STATIC_REQUIRE_FALSE(moreiter::has_length_v<ReversibleUnsized<int>>);
  STATIC_REQUIRE(moreiter::is_reversible_v<ReversibleUnsized<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_indexable_v<ReversibleUnsized<int>>);
}

TEST_CASE("capabilities: single-pass sequences are not reusable",
    "[capabilities]") {
  STATIC_REQUIRE_FALSE(moreiter::has_length_v<InputIterable<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_reversible_v<InputIterable<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_indexable_v<InputIterable<int>>);
  STATIC_REQUIRE_FALSE(moreiter::is_reusable_v<InputIterable<int>>);
}

TEST_CASE("capabilities: references report the referred type's capabilities",
    "[capabilities]") {
  STATIC_REQUIRE(moreiter::is_indexable_v<const std::vector<int>&>);
  STATIC_REQUIRE(moreiter::is_reversible_v<std::list<int>&&>);
}

TEST_CASE("capabilities: capabilities_of collects the flags",
    "[capabilities]") {
  constexpr auto caps = moreiter::capabilities_of<std::list<int>>();
  REQUIRE(caps.has_length);
  REQUIRE(caps.is_reversible);
  REQUIRE_FALSE(caps.is_indexable);
  REQUIRE(caps.is_reusable);
}

TEST_CASE("capabilities: value queries match the traits", "[capabilities]") {
  std::vector<int> v = {1, 2};
  std::forward_list<int> fl = {1, 2};
  REQUIRE(moreiter::has_length(v));
  REQUIRE(moreiter::is_reversible(v));
  REQUIRE(moreiter::is_indexable(v));
  REQUIRE_FALSE(moreiter::has_length(fl));
  REQUIRE_FALSE(moreiter::is_reversible(fl));
  REQUIRE_FALSE(moreiter::is_indexable(fl));
}

TEST_CASE("capabilities: views are lazy sequences, containers are not",
    "[capabilities]") {
  std::vector<int> v = {1, 2, 3};
  auto h = moreiter::head(v, 2);
  auto r = moreiter::reverse_iter(v);
  REQUIRE(moreiter::is_lazy_sequence(h));
  REQUIRE(moreiter::is_lazy_sequence(r));
  REQUIRE_FALSE(moreiter::is_lazy_sequence(v));
  REQUIRE_FALSE(moreiter::is_lazy_sequence(42));

  auto parts = moreiter::partition([](int i) { return i > 1; }, v);
  REQUIRE_FALSE(moreiter::is_lazy_sequence(parts));
  REQUIRE(moreiter::is_lazy_sequence(parts.first));
  REQUIRE(moreiter::is_lazy_sequence(parts.second));
}

TEST_CASE("capabilities: views are single-pass", "[capabilities]") {
  std::vector<int> v = {1, 2, 3};
  using Head = decltype(moreiter::head(v, 2));
  STATIC_REQUIRE_FALSE(moreiter::has_length_v<Head>);
  STATIC_REQUIRE_FALSE(moreiter::is_reversible_v<Head>);
  STATIC_REQUIRE_FALSE(moreiter::is_reusable_v<Head>);
}
