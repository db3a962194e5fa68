#include "tweetset/io/tweet_reader.hpp"
#include "tweetset/core/env.hpp"

#include <charconv>
#include <fstream>
#include <iostream>

namespace tweetset::io {

namespace {

using core::error;
using core::error_code;

auto parse_u32(std::string_view s, std::uint32_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  std::uint32_t tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (s.empty() || ec != std::errc() || ptr != end) return false;
  out = tmp;
  return true;
}

auto strip_cr(std::string_view s) -> std::string_view {
  if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
  return s;
}

auto at_line(std::string_view source, std::size_t line_no, const std::string& what) -> error {
  return error{error_code::data_integrity,
               std::string(source) + ":" + std::to_string(line_no) + ": " + what,
               "tweetset.reader"};
}

} // namespace

auto parse_line(std::string_view line) -> std::expected<tweet, core::error> {
  line = strip_cr(line);
  const auto t1 = line.find('\t');
  if (t1 == std::string_view::npos) {
    return std::unexpected(error{error_code::data_integrity, "missing retweets field", "tweetset.reader"});
  }
  const auto t2 = line.find('\t', t1 + 1);
  if (t2 == std::string_view::npos) {
    return std::unexpected(error{error_code::data_integrity, "missing text field", "tweetset.reader"});
  }
  tweet t{};
  t.user = std::string(line.substr(0, t1));
  if (t.user.empty()) {
    return std::unexpected(error{error_code::data_integrity, "empty user", "tweetset.reader"});
  }
  const auto count = line.substr(t1 + 1, t2 - t1 - 1);
  if (!parse_u32(count, t.retweets)) {
    return std::unexpected(error{error_code::data_integrity,
                                 "invalid retweets=\"" + std::string(count) + "\"", "tweetset.reader"});
  }
  t.text = std::string(line.substr(t2 + 1));
  return t;
}

auto read_stream(std::istream& in, std::string_view source)
    -> std::expected<tweet_set, core::error> {
  const bool dbg = core::env_flag("TWEETSET_DEBUG");

  tweet_set set;
  bool have_header = false;
  std::size_t records = 0;
  std::string raw; std::size_t line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const std::string_view line = strip_cr(raw);
    if (line.empty() || line.front() == '#') continue;

    if (!have_header) {
      if (line != tsv_header) {
        return std::unexpected(at_line(source, line_no, "bad header"));
      }
      have_header = true;
      continue;
    }

    auto t = parse_line(line);
    if (!t) return std::unexpected(at_line(source, line_no, t.error().message));
    set = set.insert(*t);
    ++records;
  }
  if (in.bad()) {
    return std::unexpected(error{error_code::io_failed, std::string(source) + ": read failed", "tweetset.reader"});
  }
  if (!have_header) {
    return std::unexpected(at_line(source, line_no, "bad header"));
  }

  if (dbg) {
    std::cerr << "[READER] " << source << ": " << records << " records, "
              << set.size() << " distinct texts" << std::endl;
  }
  return set;
}

auto read_file(const std::filesystem::path& path) -> std::expected<tweet_set, core::error> {
  std::ifstream in(path);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, path.string() + ": open failed", "tweetset.reader"});
  }
  return read_stream(in, path.string());
}

auto read_files(const std::vector<std::filesystem::path>& paths)
    -> std::expected<std::vector<tweet_set>, core::error> {
  std::vector<tweet_set> sets;
  sets.reserve(paths.size());
  for (const auto& p : paths) {
    auto s = read_file(p);
    if (!s) return std::unexpected(s.error());
    sets.push_back(std::move(*s));
  }
  return sets;
}

} // namespace tweetset::io
