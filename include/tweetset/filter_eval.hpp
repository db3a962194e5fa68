#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against tweets.
 */

#include <string>
#include <vector>

#include "tweetset/filter_expr.hpp"
#include "tweetset/tweet.hpp"
#include "tweetset/tweet_set.hpp"

namespace tweetset::filter_eval {

// Evaluate whether a tweet matches the expression.
auto matches(const filter_expr& expr, const tweet& t) -> bool;

// or(keyword...) over the given list; an empty list matches nothing.
auto any_keyword(const std::vector<std::string>& keywords) -> filter_expr;

// Predicate for tweet_set::filter; the expression is captured by value.
auto to_predicate(filter_expr expr) -> tweet_set::predicate;

} // namespace tweetset::filter_eval
