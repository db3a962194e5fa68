#include <benchmark/benchmark.h>

#include "tweetset/tweet_set.hpp"

#include <random>
#include <string>
#include <vector>

using namespace tweetset;

namespace {

std::vector<tweet> make_tweets(std::size_t n, std::uint32_t seed = 12345) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> ch(0, 25);
    std::uniform_int_distribution<std::uint32_t> rt(0, 1000);
    std::vector<tweet> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::string text(12, 'a');
        for (auto& c : text) c = static_cast<char>('a' + ch(rng));
        out[i] = tweet{"user", std::move(text), rt(rng)};
    }
    return out;
}

} // namespace

static void BM_Insert(benchmark::State& state) {
    const auto tweets = make_tweets(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto s = tweet_set::from(tweets);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Insert)->Arg(1 << 8)->Arg(1 << 12);

static void BM_Union(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto a = tweet_set::from(make_tweets(n, 1));
    const auto b = tweet_set::from(make_tweets(n, 2));
    for (auto _ : state) {
        auto u = a.union_with(b);
        benchmark::DoNotOptimize(u);
    }
}
BENCHMARK(BM_Union)->Arg(1 << 6)->Arg(1 << 9);

// Quadratic by construction; keep the sizes small.
static void BM_DescendingByRetweet(benchmark::State& state) {
    const auto s = tweet_set::from(make_tweets(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto l = s.descending_by_retweet();
        benchmark::DoNotOptimize(l);
    }
}
BENCHMARK(BM_DescendingByRetweet)->Arg(1 << 6)->Arg(1 << 9);

BENCHMARK_MAIN();
