#pragma once

/** \file tweet_set.hpp
 *  \brief Persistent set of tweets as an unbalanced binary search tree keyed by text.
 *
 * A set is either Empty or Node(elem, left, right). Every tweet in `left` has text
 * strictly less than `elem.text`, every tweet in `right` strictly greater. Nodes are
 * immutable; operations build new nodes along the modified path and share every
 * untouched subtree with the receiver, so an old set stays valid after a "write".
 *
 * Thread-safety: values may be read concurrently from any number of threads.
 * Lifetime: dropping the last owner of a chain of nodes releases it with an explicit
 * work list, so a degenerate tree is freed without recursing once per level.
 * Complexity: insert/remove/contains are O(height); the tree is not balanced, so
 * height may reach the number of elements for sorted input. union_with is
 * O(n * height) and descending_by_retweet is O(n^2).
 */

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <utility>
#include <variant>

#include "tweetset/error.hpp"
#include "tweetset/tweet.hpp"
#include "tweetset/tweet_list.hpp"

namespace tweetset {

class tweet_set {
public:
  struct node;

  using predicate = std::function<bool(const tweet&)>;
  using visitor = std::function<void(const tweet&)>;

  /** \brief Empty. */
  tweet_set() = default;
  tweet_set(const tweet_set&) = default;
  tweet_set(tweet_set&&) noexcept = default;
  tweet_set& operator=(const tweet_set&) = default;
  tweet_set& operator=(tweet_set&&) noexcept = default;
  ~tweet_set();

  /** \brief Insert every tweet of `items` in order into an empty set. */
  template <typename Range>
  static auto from(const Range& items) -> tweet_set {
    tweet_set s;
    for (const tweet& t : items) s = s.insert(t);
    return s;
  }

  [[nodiscard]] auto is_empty() const noexcept -> bool;

  auto contains(const tweet& t) const -> bool;

  /**
   * \brief Set with `t` added.
   *
   * If a tweet with the same text is already present the receiver is returned
   * unchanged: the first tweet inserted for a given text wins.
   */
  auto insert(const tweet& t) const -> tweet_set;

  /**
   * \brief Set without the tweet whose text equals `t.text`.
   *
   * A matched node is replaced by `left.union_with(right)` rather than by its
   * in-order successor, so the resulting shape can differ a lot from the input.
   */
  auto remove(const tweet& t) const -> tweet_set;

  /** \brief Tweets for which `p` holds. */
  auto filter(const predicate& p) const -> tweet_set;

  /** \brief Folds matching tweets into `acc`: left subtree, own tweet, right subtree. */
  auto filter_acc(const predicate& p, tweet_set acc) const -> tweet_set;

  /**
   * \brief Tweets present in either set.
   *
   * Node(e, l, r).union_with(o) == r.union_with(l.union_with(o.insert(e))).
   * When both sides hold a tweet with the same text the one in `other` survives.
   */
  auto union_with(const tweet_set& other) const -> tweet_set;

  /**
   * \brief Tweet with the highest retweet count.
   *
   * Visits in text order and only replaces the current best on a strictly greater
   * count, so among equal counts the tweet with the smallest text wins.
   * \return empty_collection error when the set is empty
   */
  auto most_retweeted() const -> std::expected<tweet, core::error>;

  /** \brief All tweets by non-increasing retweet count (repeated extract-max). */
  auto descending_by_retweet() const -> tweet_list;

  /** \brief Visit every tweet once: left subtree, own tweet, right subtree. */
  auto foreach(const visitor& f) const -> void;

  /** \brief Number of tweets. O(n). */
  auto size() const noexcept -> std::size_t;

  /** \brief Root node, or nullptr for Empty. */
  auto root() const noexcept -> const node*;

private:
  struct empty {};

  explicit tweet_set(std::shared_ptr<node> n) noexcept : rep_(std::move(n)) {}

  static auto make(tweet elem, tweet_set left, tweet_set right) -> tweet_set;

  // Nodes are never modified once built; the destructor only detaches children of
  // nodes it owns exclusively.
  std::variant<empty, std::shared_ptr<node>> rep_;
};

struct tweet_set::node {
  tweet elem;
  tweet_set left;
  tweet_set right;
};

} // namespace tweetset
