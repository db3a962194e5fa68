#pragma once

/** \file tweet_reader.hpp
 *  \brief Loads tweets from the line-oriented "tweetset-tsv v1" text format.
 *
 * Format:
 *   tweetset-tsv v1
 *   <user>\t<retweets>\t<text>
 *
 * - The first non-empty, non-comment line must be the header.
 * - Empty lines and lines starting with '#' are skipped; a trailing '\r' is stripped.
 * - The text is everything after the second tab and may itself contain tabs.
 * - Records are inserted in file order into an empty set, so a later line repeating
 *   an earlier text is dropped.
 *
 * Errors: io_failed when a file cannot be opened; data_integrity for a bad header or a
 * malformed record (message carries the 1-based line number).
 */

#include <expected>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "tweetset/error.hpp"
#include "tweetset/tweet.hpp"
#include "tweetset/tweet_set.hpp"

namespace tweetset::io {

inline constexpr std::string_view tsv_header = "tweetset-tsv v1";

/** \brief Parse one record line (no header, no comment). */
auto parse_line(std::string_view line) -> std::expected<tweet, core::error>;

/**
 * \brief Read a whole stream into a set.
 * \param in input stream positioned at the header
 * \param source name used in diagnostics (file path, "<stdin>")
 */
auto read_stream(std::istream& in, std::string_view source)
    -> std::expected<tweet_set, core::error>;

/** \brief Read one file into a set. */
auto read_file(const std::filesystem::path& path) -> std::expected<tweet_set, core::error>;

/** \brief One set per file, in argument order; the first error aborts. */
auto read_files(const std::vector<std::filesystem::path>& paths)
    -> std::expected<std::vector<tweet_set>, core::error>;

} // namespace tweetset::io
