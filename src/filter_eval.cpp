#include "tweetset/filter_eval.hpp"

#include <algorithm>
#include <utility>

namespace tweetset::filter_eval {

namespace {

auto eval(const filter_expr& e, const tweet& t) -> bool {
  if (const auto* k = std::get_if<keyword>(&e.node)) {
    return t.text.find(k->needle) != std::string::npos;
  }
  if (const auto* a = std::get_if<author>(&e.node)) {
    return t.user == a->name;
  }
  if (const auto* r = std::get_if<retweet_range>(&e.node)) {
    return r->min_retweets <= t.retweets && t.retweets <= r->max_retweets;
  }
  auto holds = [&t](const filter_expr& c) { return eval(c, t); };
  if (const auto* all = std::get_if<filter_expr::and_t>(&e.node)) {
    // Vacuously true without children.
    return std::all_of(all->children.begin(), all->children.end(), holds);
  }
  if (const auto* any = std::get_if<filter_expr::or_t>(&e.node)) {
    return std::any_of(any->children.begin(), any->children.end(), holds);
  }
  if (const auto* neg = std::get_if<filter_expr::not_t>(&e.node)) {
    // not(a, b) rejects a tweet matching either child.
    return std::none_of(neg->children.begin(), neg->children.end(), holds);
  }
  return false;
}

} // namespace

auto matches(const filter_expr& expr, const tweet& t) -> bool {
  return eval(expr, t);
}

auto any_keyword(const std::vector<std::string>& keywords) -> filter_expr {
  filter_expr::or_t any;
  any.children.reserve(keywords.size());
  for (const auto& k : keywords) any.children.push_back(filter_expr{keyword{k}});
  return filter_expr{std::move(any)};
}

auto to_predicate(filter_expr expr) -> tweet_set::predicate {
  return [e = std::move(expr)](const tweet& t) { return eval(e, t); };
}

} // namespace tweetset::filter_eval
