#pragma once

/** \file trending.hpp
 *  \brief Keyword classification of tweet sources and the trending ranking.
 *
 * Sources are filtered by two keyword lists (Google and Apple products by default),
 * the matches are merged with union_with and ranked by descending_by_retweet.
 *
 * Thread-safety: trending_view memoizes lazily and is not synchronised; share it
 * across threads only after the accessors have been called once.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tweetset/error.hpp"
#include "tweetset/filter_expr.hpp"
#include "tweetset/tweet_list.hpp"
#include "tweetset/tweet_set.hpp"

namespace tweetset {

auto default_google_keywords() -> std::vector<std::string>;
auto default_apple_keywords() -> std::vector<std::string>;

/** \brief Configuration of the trending view and of its consumers. */
struct trending_options {
  std::vector<std::string> google_keywords{default_google_keywords()}; /**< first list */
  std::vector<std::string> apple_keywords{default_apple_keywords()};   /**< second list */
  std::uint32_t min_retweets{0};                                       /**< popularity floor */
  std::size_t limit{0};                                                /**< max printed, 0 = all */
};

/** \brief Split a comma separated list, dropping empty tokens. */
auto parse_keyword_list(std::string_view csv) -> std::vector<std::string>;

/**
 * \brief Apply environment overrides on top of `base`.
 *
 * TWEETSET_GOOGLE_KEYWORDS / TWEETSET_APPLE_KEYWORDS: comma separated lists.
 * TWEETSET_LIMIT, TWEETSET_MIN_RETWEETS: unsigned integers.
 * \return config_invalid when a list is set but empty or a number is malformed
 */
auto options_from_env(trending_options base = {}) -> std::expected<trending_options, core::error>;

/**
 * \brief Classifier used for one side of the view.
 *
 * or(keyword...) over `keywords`, and-ed with retweet_range{min_retweets} when the
 * floor is non-zero.
 */
auto keyword_filter(const std::vector<std::string>& keywords, std::uint32_t min_retweets = 0)
    -> filter_expr;

/**
 * \brief Union over all sources of the tweets matching `expr`.
 *
 * Equivalent to s0.filter(p).union_with(s1.filter(p).union_with(... Empty)), so on
 * equal texts the tweet from the later source survives.
 */
auto tweets_matching(const std::vector<tweet_set>& sources, const filter_expr& expr) -> tweet_set;

/** \brief tweets_matching(sources, keyword_filter(keywords)). */
auto tweets_matching(const std::vector<tweet_set>& sources,
                     const std::vector<std::string>& keywords) -> tweet_set;

class trending_view {
public:
  explicit trending_view(std::vector<tweet_set> sources, trending_options opts = {});

  /** \brief Tweets matching the Google keywords; computed on first call. */
  auto google_tweets() const -> const tweet_set&;
  /** \brief Tweets matching the Apple keywords; computed on first call. */
  auto apple_tweets() const -> const tweet_set&;
  /** \brief (google union apple) by descending retweets; computed on first call. */
  auto trending() const -> const tweet_list&;

  auto options() const noexcept -> const trending_options& { return opts_; }

private:
  std::vector<tweet_set> sources_;
  trending_options opts_;
  mutable std::optional<tweet_set> google_;
  mutable std::optional<tweet_set> apple_;
  mutable std::optional<tweet_list> trending_;
};

} // namespace tweetset
