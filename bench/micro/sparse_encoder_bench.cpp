/** \file sparse_encoder_bench.cpp
 *  \brief Throughput of BM25 bucket encoding and metadata backfill scans.
 */

#include <benchmark/benchmark.h>
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/io/jsonl.hpp"
#include "veclex/text/tokenizer.hpp"
#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace veclex;
using namespace veclex::index;

namespace {

// Generate random text documents
std::vector<std::string> generate_documents(std::size_t n_docs,
                                            std::size_t avg_length,
                                            std::size_t vocab_size) {
    std::vector<std::string> docs;
    std::mt19937 gen(42);
    std::uniform_int_distribution<> word_dist(0, static_cast<int>(vocab_size) - 1);
    std::normal_distribution<> len_dist(static_cast<double>(avg_length), avg_length / 4.0);

    for (std::size_t i = 0; i < n_docs; ++i) {
        std::string doc;
        int doc_len = std::max(1, static_cast<int>(len_dist(gen)));
        for (int j = 0; j < doc_len; ++j) {
            if (j > 0) doc += " ";
            doc += "word" + std::to_string(word_dist(gen));
        }
        docs.push_back(doc);
    }
    return docs;
}

} // namespace

static void BM_Tokenize(benchmark::State& state) {
    const auto docs = generate_documents(256, static_cast<std::size_t>(state.range(0)), 5000);
    std::size_t bytes = 0;
    for (const auto& d : docs) bytes += d.size();

    for (auto _ : state) {
        for (const auto& d : docs) {
            auto tokens = text::Tokenizer::tokenize(d);
            benchmark::DoNotOptimize(tokens);
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * bytes));
}
BENCHMARK(BM_Tokenize)->Arg(20)->Arg(200);

static void BM_EncodeCorpus(benchmark::State& state) {
    const auto docs = generate_documents(static_cast<std::size_t>(state.range(0)), 50, 10000);
    SparseEncoderParams params;
    params.threads = static_cast<std::uint32_t>(state.range(1));
    auto encoder = SparseEncoder::create(params);
    if (!encoder) {
        state.SkipWithError("encoder creation failed");
        return;
    }

    for (auto _ : state) {
        auto out = encoder->encode_corpus(docs);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EncodeCorpus)
    ->Args({1000, 1})
    ->Args({10000, 1})
    ->Args({10000, 4})
    ->Unit(benchmark::kMillisecond);

static void BM_EncodeQuery(benchmark::State& state) {
    const auto queries = generate_documents(64, 6, 10000);
    auto encoder = SparseEncoder::create(SparseEncoderParams{});
    if (!encoder) {
        state.SkipWithError("encoder creation failed");
        return;
    }

    for (auto _ : state) {
        for (const auto& q : queries) {
            auto v = encoder->encode_query(q);
            benchmark::DoNotOptimize(v);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(queries.size()));
}
BENCHMARK(BM_EncodeQuery);

static void BM_ScanEntryLines(benchmark::State& state) {
    std::vector<nlohmann::json> lines;
    const auto n = static_cast<std::size_t>(state.range(0));
    lines.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        lines.push_back({{"id", "doc-" + std::to_string(i)},
                         {"embedding", std::vector<float>(64, 0.125f)},
                         {"embedding_metadata", {{"title", "item " + std::to_string(i)}}}});
    }
    const std::string content = io::write_lines(lines);

    for (auto _ : state) {
        std::size_t seen = 0;
        io::for_each_object(content, [&seen](nlohmann::json&&) {
            ++seen;
            return true;
        });
        benchmark::DoNotOptimize(seen);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * content.size()));
}
BENCHMARK(BM_ScanEntryLines)->Arg(1000)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
