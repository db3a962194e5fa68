#include "tweetset/core/env.hpp"
#include "tweetset/io/tweet_reader.hpp"
#include "tweetset/trending.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sstream>

using tweetset::trending_view;
using tweetset::tweet_set;

namespace fs = std::filesystem;

namespace {
struct Args {
    std::vector<fs::path> inputs;  // empty => stdin
    std::optional<std::vector<std::string>> google;
    std::optional<std::vector<std::string>> apple;
    std::optional<std::size_t> limit;
    std::optional<std::uint32_t> min_retweets;
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "tweetset trending\n"
              << "Usage: tweetset_trending [--input=a.tsv,b.tsv] [--google=k1,k2] [--apple=k1,k2]\n"
              << "  [--limit=N] [--min-retweets=N] [--help]\n"
              << "Reads \"tweetset-tsv v1\" files (stdin when no --input is given) and prints the\n"
              << "tweets mentioning either keyword list by descending retweet count.\n"
              << "Environment: TWEETSET_GOOGLE_KEYWORDS, TWEETSET_APPLE_KEYWORDS, TWEETSET_LIMIT,\n"
              << "  TWEETSET_MIN_RETWEETS; TWEETSET_DEBUG=1 writes diagnostics to stderr.\n";
}

static std::vector<fs::path> parse_csv_paths(const std::string& s) {
    std::vector<fs::path> out; std::stringstream ss(s); std::string tok;
    while (std::getline(ss, tok, ',')) { if (!tok.empty()) out.emplace_back(tok); }
    return out;
}
}

int main(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--input=")) { auto p = parse_csv_paths(*v); args.inputs.insert(args.inputs.end(), p.begin(), p.end()); }
        else if (auto v = eat(a, "--google=")) args.google = tweetset::parse_keyword_list(*v);
        else if (auto v = eat(a, "--apple=")) args.apple = tweetset::parse_keyword_list(*v);
        else if (auto v = eat(a, "--limit=")) {
            args.limit = tweetset::core::parse_size(*v);
            if (!args.limit) { std::cerr << "invalid --limit value: " << *v << "\n"; return 2; }
        }
        else if (auto v = eat(a, "--min-retweets=")) {
            auto n = tweetset::core::parse_size(*v);
            if (!n || *n > std::numeric_limits<std::uint32_t>::max()) {
                std::cerr << "invalid --min-retweets value: " << *v << "\n";
                return 2;
            }
            args.min_retweets = static_cast<std::uint32_t>(*n);
        }
        else { std::cerr << "unknown argument: " << a << "\n"; print_usage(); return 2; }
    }

    auto opts = tweetset::options_from_env();
    if (!opts) {
        std::cerr << "configuration error: " << opts.error().message << std::endl;
        return 1;
    }
    if (args.google) opts->google_keywords = *args.google;
    if (args.apple) opts->apple_keywords = *args.apple;
    if (args.limit) opts->limit = *args.limit;
    if (args.min_retweets) opts->min_retweets = *args.min_retweets;
    if (opts->google_keywords.empty() || opts->apple_keywords.empty()) {
        std::cerr << "keyword lists must not be empty\n";
        return 2;
    }

    std::vector<tweet_set> sources;
    if (args.inputs.empty()) {
        auto s = tweetset::io::read_stream(std::cin, "<stdin>");
        if (!s) {
            std::cerr << "read error [" << tweetset::core::to_string(s.error().code) << "]: "
                      << s.error().message << std::endl;
            return 1;
        }
        sources.push_back(std::move(*s));
    } else {
        auto s = tweetset::io::read_files(args.inputs);
        if (!s) {
            std::cerr << "read error [" << tweetset::core::to_string(s.error().code) << "]: "
                      << s.error().message << std::endl;
            return 1;
        }
        sources = std::move(*s);
    }

    const std::size_t limit = opts->limit;
    trending_view view(std::move(sources), std::move(*opts));
    std::size_t printed = 0;
    for (const auto& t : view.trending()) {
        if (limit != 0 && printed == limit) break;
        std::cout << t << "\n";
        ++printed;
    }
    std::cout.flush();
    return 0;
}
