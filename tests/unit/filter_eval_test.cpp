#include <catch2/catch_test_macros.hpp>
#include <tweetset/filter_eval.hpp>
#include <tweetset/filter_expr.hpp>

#include "tests/support/tweet_test_helpers.hpp"

using namespace tweetset;

TEST_CASE("filter eval basic semantics", "[filter]"){
  const tweet t1{"alice", "new android phone", 12};
  const tweet t2{"bob", "my iPhone broke", 3};

  filter_expr k_android{ keyword{"android"} };
  filter_expr k_iphone{ keyword{"iPhone"} };
  filter_expr by_alice{ author{"alice"} };
  filter_expr popular{ retweet_range{10, 100} };
  filter_expr both{ filter_expr::and_t{ {k_android, popular} } };
  filter_expr any{ filter_expr::or_t{ {k_android, k_iphone} } };
  filter_expr none{ filter_expr::not_t{ {k_android, k_iphone} } };
  filter_expr empty_and{ filter_expr::and_t{ { } } };
  filter_expr empty_or{ filter_expr::or_t{ { } } };
  filter_expr empty_not{ filter_expr::not_t{ { } } };

  REQUIRE(filter_eval::matches(k_android, t1));
  REQUIRE_FALSE(filter_eval::matches(k_android, t2));
  REQUIRE(filter_eval::matches(by_alice, t1));
  REQUIRE_FALSE(filter_eval::matches(by_alice, t2));
  REQUIRE(filter_eval::matches(popular, t1));
  REQUIRE_FALSE(filter_eval::matches(popular, t2));
  REQUIRE(filter_eval::matches(both, t1));
  REQUIRE(filter_eval::matches(any, t1));
  REQUIRE(filter_eval::matches(any, t2));
  REQUIRE_FALSE(filter_eval::matches(none, t1));
  REQUIRE(filter_eval::matches(empty_and, t2));
  REQUIRE_FALSE(filter_eval::matches(empty_or, t2));
  REQUIRE(filter_eval::matches(empty_not, t2));
}

TEST_CASE("keyword matching is a case-sensitive substring test", "[filter]"){
  const filter_expr kws = filter_eval::any_keyword({"ios", "iPad"});
  REQUIRE(filter_eval::matches(kws, tweet{"u", "biosphere", 0}));
  REQUIRE(filter_eval::matches(kws, tweet{"u", "new iPad today", 0}));
  REQUIRE_FALSE(filter_eval::matches(kws, tweet{"u", "IOS update", 0}));
  REQUIRE_FALSE(filter_eval::matches(kws, tweet{"u", "IPAD", 0}));
  REQUIRE_FALSE(filter_eval::matches(filter_eval::any_keyword({}), tweet{"u", "anything", 0}));
}

TEST_CASE("predicates drive set filtering", "[filter]"){
  const tweet_set s = tweet_set::from(std::vector<tweet>{
      {"a", "galaxy s", 4}, {"b", "nexus 5", 40}, {"c", "ipad air", 7}, {"d", "weather", 90}});

  filter_expr expr{ filter_expr::and_t{ {
      filter_eval::any_keyword({"galaxy", "nexus", "ipad"}),
      filter_expr{ retweet_range{5} } } } };
  const tweet_set hits = s.filter(filter_eval::to_predicate(expr));

  REQUIRE(tweet_test_helpers::keys_of(hits) == std::set<std::string>{"ipad air", "nexus 5"});
}
