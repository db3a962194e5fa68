#pragma once

/** \file filter_expr.hpp
 *  \brief Filter expression AST for tweet predicates.
 *
 * Use cases: classify tweets by keyword, author or popularity before a set filter.
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace tweetset {

/** \brief Text contains `needle` (case-sensitive substring). */
struct keyword {
  std::string needle;
};

/** \brief Author equality predicate user == name. */
struct author {
  std::string name;
};

/** \brief Popularity predicate min_retweets ≤ retweets ≤ max_retweets. */
struct retweet_range {
  std::uint32_t min_retweets{0};                                      /**< inclusive */
  std::uint32_t max_retweets{std::numeric_limits<std::uint32_t>::max()}; /**< inclusive */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<keyword, author, retweet_range, and_t, or_t, not_t> node; /**< root node */
};

} // namespace tweetset
