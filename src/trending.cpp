#include "tweetset/trending.hpp"
#include "tweetset/core/env.hpp"
#include "tweetset/filter_eval.hpp"

#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace tweetset {

auto default_google_keywords() -> std::vector<std::string> {
  return {"android", "Android", "galaxy", "Galaxy", "nexus", "Nexus"};
}

auto default_apple_keywords() -> std::vector<std::string> {
  return {"ios", "iOS", "iphone", "iPhone", "ipad", "iPad"};
}

auto parse_keyword_list(std::string_view csv) -> std::vector<std::string> {
  std::vector<std::string> out; std::stringstream ss{std::string(csv)}; std::string tok;
  while (std::getline(ss, tok, ',')) { if (!tok.empty()) out.push_back(tok); }
  return out;
}

auto options_from_env(trending_options base) -> std::expected<trending_options, core::error> {
  using core::error; using core::error_code;

  auto list_override = [](const char* name, std::vector<std::string>& dst)
      -> std::expected<void, error> {
    auto v = core::safe_getenv(name);
    if (!v) return {};
    auto kw = parse_keyword_list(*v);
    if (kw.empty()) {
      return std::unexpected(error{error_code::config_invalid,
                                   std::string(name) + " has no keywords", "tweetset.trending"});
    }
    dst = std::move(kw);
    return {};
  };

  if (auto r = list_override("TWEETSET_GOOGLE_KEYWORDS", base.google_keywords); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = list_override("TWEETSET_APPLE_KEYWORDS", base.apple_keywords); !r) {
    return std::unexpected(r.error());
  }
  auto limit = core::env_size("TWEETSET_LIMIT");
  if (!limit) return std::unexpected(limit.error());
  if (*limit) base.limit = **limit;

  auto min_rt = core::env_size("TWEETSET_MIN_RETWEETS");
  if (!min_rt) return std::unexpected(min_rt.error());
  if (*min_rt) {
    if (**min_rt > std::numeric_limits<std::uint32_t>::max()) {
      return std::unexpected(error{error_code::config_invalid,
                                   "TWEETSET_MIN_RETWEETS out of range", "tweetset.trending"});
    }
    base.min_retweets = static_cast<std::uint32_t>(**min_rt);
  }
  return base;
}

auto keyword_filter(const std::vector<std::string>& keywords, std::uint32_t min_retweets)
    -> filter_expr {
  filter_expr any = filter_eval::any_keyword(keywords);
  if (min_retweets == 0) return any;
  return filter_expr{filter_expr::and_t{{std::move(any), filter_expr{retweet_range{min_retweets}}}}};
}

auto tweets_matching(const std::vector<tweet_set>& sources, const filter_expr& expr) -> tweet_set {
  const tweet_set::predicate p = filter_eval::to_predicate(expr);
  tweet_set acc;
  for (auto it = sources.rbegin(); it != sources.rend(); ++it) {
    acc = it->filter(p).union_with(acc);
  }
  return acc;
}

auto tweets_matching(const std::vector<tweet_set>& sources,
                     const std::vector<std::string>& keywords) -> tweet_set {
  return tweets_matching(sources, keyword_filter(keywords));
}

trending_view::trending_view(std::vector<tweet_set> sources, trending_options opts)
    : sources_(std::move(sources)), opts_(std::move(opts)) {}

auto trending_view::google_tweets() const -> const tweet_set& {
  if (!google_) {
    google_ = tweets_matching(sources_, keyword_filter(opts_.google_keywords, opts_.min_retweets));
  }
  return *google_;
}

auto trending_view::apple_tweets() const -> const tweet_set& {
  if (!apple_) {
    apple_ = tweets_matching(sources_, keyword_filter(opts_.apple_keywords, opts_.min_retweets));
  }
  return *apple_;
}

auto trending_view::trending() const -> const tweet_list& {
  if (!trending_) {
    const auto& g = google_tweets();
    const auto& a = apple_tweets();
    if (core::env_flag("TWEETSET_DEBUG")) {
      std::cerr << "[TRENDING] sources=" << sources_.size() << " google=" << g.size()
                << " apple=" << a.size() << std::endl;
    }
    trending_ = g.union_with(a).descending_by_retweet();
  }
  return *trending_;
}

} // namespace tweetset
