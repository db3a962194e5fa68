#include "tweetset/tweet_list.hpp"

#include <utility>

namespace tweetset {

namespace {

auto empty_list_error(const char* what) -> core::error {
  return core::error{core::error_code::empty_collection, what, "tweetset.list"};
}

} // namespace

tweet_list::tweet_list(tweet head, tweet_list tail)
    : rep_(std::make_shared<cons>(cons{std::move(head), std::move(tail)})) {}

// Release uniquely owned cells one by one so that dropping a long list does not
// recurse once per element.
tweet_list::~tweet_list() {
  auto* p = std::get_if<std::shared_ptr<cons>>(&rep_);
  if (!p) return;
  std::shared_ptr<cons> cur = std::move(*p);
  while (cur && cur.use_count() == 1) {
    std::shared_ptr<cons> next;
    if (auto* n = std::get_if<std::shared_ptr<cons>>(&cur->tail.rep_)) next = std::move(*n);
    cur = std::move(next);
  }
}

auto tweet_list::cell() const noexcept -> const cons* {
  if (auto* p = std::get_if<std::shared_ptr<cons>>(&rep_)) return p->get();
  return nullptr;
}

auto tweet_list::is_empty() const noexcept -> bool {
  return cell() == nullptr;
}

auto tweet_list::head() const -> std::expected<tweet, core::error> {
  if (const cons* c = cell()) return c->head;
  return std::unexpected(empty_list_error("head of empty list"));
}

auto tweet_list::tail() const -> std::expected<tweet_list, core::error> {
  if (const cons* c = cell()) return c->tail;
  return std::unexpected(empty_list_error("tail of empty list"));
}

auto tweet_list::foreach(const visitor& f) const -> void {
  for (const cons* c = cell(); c != nullptr; c = c->tail.cell()) f(c->head);
}

auto tweet_list::size() const noexcept -> std::size_t {
  std::size_t n = 0;
  for (const cons* c = cell(); c != nullptr; c = c->tail.cell()) ++n;
  return n;
}

} // namespace tweetset
