#include "tweetset/tweet_set.hpp"

#include <vector>

namespace tweetset {

namespace {

// In-order walk keeping the first tweet with a strictly greater count.
auto max_by_retweets(const tweet_set& s, const tweet* best) -> const tweet* {
  const tweet_set::node* n = s.root();
  if (n == nullptr) return best;
  best = max_by_retweets(n->left, best);
  if (best == nullptr || n->elem.retweets > best->retweets) best = &n->elem;
  return max_by_retweets(n->right, best);
}

} // namespace

auto tweet_set::make(tweet elem, tweet_set left, tweet_set right) -> tweet_set {
  return tweet_set(std::make_shared<node>(node{std::move(elem), std::move(left), std::move(right)}));
}

tweet_set::~tweet_set() {
  auto* p = std::get_if<std::shared_ptr<node>>(&rep_);
  if (p == nullptr || !*p || p->use_count() != 1) return;
  std::vector<std::shared_ptr<node>> pending;
  pending.push_back(std::move(*p));
  while (!pending.empty()) {
    std::shared_ptr<node> cur = std::move(pending.back());
    pending.pop_back();
    if (cur.use_count() != 1) continue;
    for (tweet_set* child : {&cur->left, &cur->right}) {
      auto* c = std::get_if<std::shared_ptr<node>>(&child->rep_);
      if (c != nullptr && *c) pending.push_back(std::move(*c));
    }
  }
}

auto tweet_set::root() const noexcept -> const node* {
  if (auto* p = std::get_if<std::shared_ptr<node>>(&rep_)) return p->get();
  return nullptr;
}

auto tweet_set::is_empty() const noexcept -> bool {
  return root() == nullptr;
}

auto tweet_set::contains(const tweet& t) const -> bool {
  const node* n = root();
  if (n == nullptr) return false;
  if (key_less(t, n->elem)) return n->left.contains(t);
  if (key_less(n->elem, t)) return n->right.contains(t);
  return true;
}

auto tweet_set::insert(const tweet& t) const -> tweet_set {
  const node* n = root();
  if (n == nullptr) return make(t, tweet_set{}, tweet_set{});
  if (key_less(t, n->elem)) return make(n->elem, n->left.insert(t), n->right);
  if (key_less(n->elem, t)) return make(n->elem, n->left, n->right.insert(t));
  return *this;
}

auto tweet_set::remove(const tweet& t) const -> tweet_set {
  const node* n = root();
  if (n == nullptr) return *this;
  if (key_less(t, n->elem)) return make(n->elem, n->left.remove(t), n->right);
  if (key_less(n->elem, t)) return make(n->elem, n->left, n->right.remove(t));
  return n->left.union_with(n->right);
}

auto tweet_set::filter(const predicate& p) const -> tweet_set {
  return filter_acc(p, tweet_set{});
}

auto tweet_set::filter_acc(const predicate& p, tweet_set acc) const -> tweet_set {
  const node* n = root();
  if (n == nullptr) return acc;
  acc = n->left.filter_acc(p, std::move(acc));
  if (p(n->elem)) acc = acc.insert(n->elem);
  return n->right.filter_acc(p, std::move(acc));
}

auto tweet_set::union_with(const tweet_set& other) const -> tweet_set {
  const node* n = root();
  if (n == nullptr) return other;
  return n->right.union_with(n->left.union_with(other.insert(n->elem)));
}

auto tweet_set::most_retweeted() const -> std::expected<tweet, core::error> {
  if (const tweet* best = max_by_retweets(*this, nullptr)) return *best;
  return std::unexpected(core::error{core::error_code::empty_collection,
                                     "most_retweeted of empty set", "tweetset.set"});
}

// Extraction runs as a loop and the list is assembled back to front, so the
// stack depth stays bounded by tree height rather than by element count.
auto tweet_set::descending_by_retweet() const -> tweet_list {
  std::vector<tweet> order;
  tweet_set rest = *this;
  while (auto top = rest.most_retweeted()) {
    rest = rest.remove(*top);
    order.push_back(std::move(*top));
  }
  tweet_list out;
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    out = tweet_list(std::move(*it), std::move(out));
  }
  return out;
}

auto tweet_set::foreach(const visitor& f) const -> void {
  const node* n = root();
  if (n == nullptr) return;
  n->left.foreach(f);
  f(n->elem);
  n->right.foreach(f);
}

auto tweet_set::size() const noexcept -> std::size_t {
  const node* n = root();
  if (n == nullptr) return 0;
  return n->left.size() + 1 + n->right.size();
}

} // namespace tweetset
