/** \file tweet_list_test.cpp
 *  \brief Unit tests for the persistent result list.
 */

#include <catch2/catch_test_macros.hpp>

#include "tweetset/tweet_list.hpp"
#include "tests/support/tweet_test_helpers.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace tweetset;
using tweet_test_helpers::to_vector;

TEST_CASE("nil", "[tweet_list]") {
  const tweet_list nil;
  REQUIRE(nil.is_empty());
  REQUIRE(nil.size() == 0);
  REQUIRE(nil.begin() == nil.end());

  auto h = nil.head();
  REQUIRE_FALSE(h.has_value());
  REQUIRE(h.error().code == core::error_code::empty_collection);

  auto t = nil.tail();
  REQUIRE_FALSE(t.has_value());
  REQUIRE(t.error().code == core::error_code::empty_collection);
  REQUIRE(t.error().component == "tweetset.list");

  int visits = 0;
  nil.foreach([&](const tweet&) { ++visits; });
  REQUIRE(visits == 0);
}

TEST_CASE("cons", "[tweet_list]") {
  const tweet_list l(tweet{"a", "first", 3}, tweet_list(tweet{"b", "second", 2}, tweet_list{}));
  REQUIRE_FALSE(l.is_empty());
  REQUIRE(l.size() == 2);

  auto h = l.head();
  REQUIRE(h.has_value());
  REQUIRE(h->text == "first");

  auto rest = l.tail();
  REQUIRE(rest.has_value());
  REQUIRE(rest->size() == 1);
  REQUIRE(rest->head()->text == "second");
  REQUIRE(rest->tail()->is_empty());
}

TEST_CASE("traversal follows construction order and can be repeated", "[tweet_list]") {
  tweet_list l;
  for (int i = 4; i >= 0; --i) l = tweet_list(tweet{"u", std::to_string(i), static_cast<std::uint32_t>(i)}, l);

  std::vector<std::string> once;
  for (const auto& t : l) once.push_back(t.text);
  std::vector<std::string> twice;
  for (auto it = l.begin(); it != l.end(); ++it) twice.push_back(it->text);

  REQUIRE(once == std::vector<std::string>{"0", "1", "2", "3", "4"});
  REQUIRE(twice == once);

  const auto via_foreach = to_vector(l);
  REQUIRE(via_foreach.size() == 5);
  REQUIRE(std::equal(via_foreach.begin(), via_foreach.end(), l.begin()));
}

TEST_CASE("prepending shares the tail", "[tweet_list]") {
  const tweet_list base(tweet{"u", "shared", 1}, tweet_list{});
  const tweet_list a(tweet{"u", "a", 2}, base);
  const tweet_list b(tweet{"u", "b", 3}, base);

  REQUIRE(base.size() == 1);
  REQUIRE(a.tail()->begin() == base.begin());
  REQUIRE(b.tail()->begin() == base.begin());
}

TEST_CASE("long lists are released without deep recursion", "[tweet_list]") {
  tweet_list l;
  for (std::uint32_t i = 0; i < 500000; ++i) l = tweet_list(tweet{"u", "t", i}, std::move(l));
  REQUIRE(l.size() == 500000);

  const tweet_list keep = *l.tail();
  l = tweet_list{};
  REQUIRE(keep.size() == 499999);
}
