#pragma once

/** \file tweet_list.hpp
 *  \brief Persistent singly-linked list of tweets (query results).
 *
 * A list is either Nil or Cons(head, tail). Cells are shared between lists and never
 * modified after construction, so prepending to a list leaves the original valid.
 *
 * Errors: head() and tail() on Nil return error_code::empty_collection; callers are
 * expected to check is_empty() first.
 */

#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <memory>
#include <variant>

#include "tweetset/error.hpp"
#include "tweetset/tweet.hpp"

namespace tweetset {

class tweet_list {
public:
  struct cons;
  class const_iterator;

  using visitor = std::function<void(const tweet&)>;

  /** \brief Nil. */
  tweet_list() = default;

  /** \brief Cons: a new cell holding `head` in front of `tail`. */
  tweet_list(tweet head, tweet_list tail);

  ~tweet_list();
  tweet_list(const tweet_list&) = default;
  tweet_list& operator=(const tweet_list&) = default;
  tweet_list(tweet_list&&) noexcept = default;
  tweet_list& operator=(tweet_list&&) noexcept = default;

  [[nodiscard]] auto is_empty() const noexcept -> bool;

  /** \brief First element; empty_collection on Nil. */
  auto head() const -> std::expected<tweet, core::error>;

  /** \brief Everything after the first element; empty_collection on Nil. */
  auto tail() const -> std::expected<tweet_list, core::error>;

  /** \brief Visit elements front to back. */
  auto foreach(const visitor& f) const -> void;

  /** \brief Number of elements. O(n). */
  auto size() const noexcept -> std::size_t;

  auto begin() const noexcept -> const_iterator;
  auto end() const noexcept -> const_iterator;

private:
  struct nil {};

  auto cell() const noexcept -> const cons*;

  std::variant<nil, std::shared_ptr<cons>> rep_;
};

struct tweet_list::cons {
  tweet head;
  tweet_list tail;
};

/** \brief Restartable forward iterator; every traversal yields construction order. */
class tweet_list::const_iterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using value_type = tweet;
  using difference_type = std::ptrdiff_t;
  using pointer = const tweet*;
  using reference = const tweet&;

  const_iterator() = default;
  explicit const_iterator(const cons* c) noexcept : cell_(c) {}

  reference operator*() const noexcept { return cell_->head; }
  pointer operator->() const noexcept { return &cell_->head; }

  const_iterator& operator++() noexcept { cell_ = cell_->tail.cell(); return *this; }
  const_iterator operator++(int) noexcept { auto old = *this; ++*this; return old; }

  friend bool operator==(const const_iterator& a, const const_iterator& b) noexcept {
    return a.cell_ == b.cell_;
  }
  friend bool operator!=(const const_iterator& a, const const_iterator& b) noexcept {
    return !(a == b);
  }

private:
  const cons* cell_{nullptr};
};

inline auto tweet_list::begin() const noexcept -> const_iterator { return const_iterator(cell()); }
inline auto tweet_list::end() const noexcept -> const_iterator { return const_iterator(); }

} // namespace tweetset
