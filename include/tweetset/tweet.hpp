#pragma once

/** \file tweet.hpp
 *  \brief The record stored in tweet sets.
 *
 * Identity is the message text: two tweets with the same text are the same
 * element regardless of author or retweet count.
 */

#include <cstdint>
#include <ostream>
#include <string>

namespace tweetset {

/** \brief One tweet: author, message text (the ordering key) and retweet count. */
struct tweet {
  std::string user;            /**< author handle */
  std::string text;            /**< message text; ordering and equality key */
  std::uint32_t retweets{0};   /**< popularity score */
};

/** \brief Key equality: true iff the texts are equal. */
inline auto operator==(const tweet& a, const tweet& b) noexcept -> bool {
  return a.text == b.text;
}

/** \brief Key ordering by text. */
inline auto key_less(const tweet& a, const tweet& b) noexcept -> bool {
  return a.text < b.text;
}

/** \brief Prints "User: <user>\nText: <text> [<retweets>]". */
inline auto operator<<(std::ostream& os, const tweet& t) -> std::ostream& {
  return os << "User: " << t.user << "\n"
            << "Text: " << t.text << " [" << t.retweets << "]";
}

} // namespace tweetset
