#include "veclex/index/sparse_encoder.hpp"
#include "veclex/core/platform_utils.hpp"
#include "veclex/text/tokenizer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iostream>
#include <limits>
#include <unordered_set>

#include <roaring/roaring.hh>

namespace veclex::index {

namespace {

// Fixed-size bucket array with a bitmap of touched slots. The bitmap keeps
// draining proportional to the number of distinct buckets rather than to
// bucket_count, so one accumulator can be reused across documents.
class BucketAccumulator {
public:
    explicit BucketAccumulator(std::uint32_t bucket_count)
        : weights_(bucket_count, 0.0f) {}

    auto add(std::uint32_t bucket, float weight) -> void {
        weights_[bucket] += weight;
        touched_.add(bucket);
    }

    // Emits non-zero buckets in ascending order and resets the touched slots.
    auto drain() -> TermBucketVector {
        TermBucketVector out;
        out.dimensions.reserve(touched_.cardinality());
        out.values.reserve(touched_.cardinality());
        for (std::uint32_t bucket : touched_) {
            if (weights_[bucket] != 0.0f) {
                out.dimensions.push_back(bucket);
                out.values.push_back(weights_[bucket]);
            }
            weights_[bucket] = 0.0f;
        }
        touched_ = roaring::Roaring{};
        return out;
    }

private:
    std::vector<float> weights_;
    roaring::Roaring touched_;
};

// BM25 weights of one document, accumulated per bucket.
auto score_into(BucketAccumulator& acc, const SparseEncoder& encoder,
                const DocumentTerms& doc, const CorpusStats& stats) -> TermBucketVector {
    const double k1 = encoder.params().bm25.k1;
    const double b = encoder.params().bm25.b;
    const double doc_len_norm = 1.0 - b + b * (static_cast<double>(doc.length) / stats.avg_doc_length);

    for (const auto& [term, count] : doc.term_freqs) {
        const double tf = static_cast<double>(count);
        const double score = stats.idf(term) * (tf * (k1 + 1.0)) / (tf + k1 * doc_len_norm);
        acc.add(encoder.bucket_of(term), static_cast<float>(score));
    }
    return acc.drain();
}

auto validate_params(const SparseEncoderParams& params) -> std::expected<void, core::error> {
    if (params.bucket_count <= 0) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "bucket_count must be positive", "index.sparse"});
    }
    if (params.bucket_count > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "bucket_count exceeds 32-bit bucket space", "index.sparse"});
    }
    if (!(params.bm25.k1 > 0.0f)) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "k1 must be positive", "index.sparse"});
    }
    if (params.bm25.b < 0.0f || params.bm25.b > 1.0f) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "b must be between 0 and 1", "index.sparse"});
    }
    return {};
}

} // anonymous namespace

// TermBucketVector implementation

auto TermBucketVector::has_signal() const noexcept -> bool {
    return std::any_of(values.begin(), values.end(), [](float v) { return v != 0.0f; });
}

auto TermBucketVector::is_valid(std::uint32_t bucket_count) const -> bool {
    if (dimensions.size() != values.size()) return false;
    std::unordered_set<std::uint32_t> seen;
    seen.reserve(dimensions.size());
    for (std::uint32_t d : dimensions) {
        if (bucket_count != 0 && d >= bucket_count) return false;
        if (!seen.insert(d).second) return false;
    }
    return true;
}

// CorpusStats implementation

auto CorpusStats::idf(const std::string& term) const -> double {
    auto it = doc_freqs.find(term);
    const double df = it == doc_freqs.end() ? 0.0 : static_cast<double>(it->second);
    const double n = static_cast<double>(num_documents);
    // The +1 keeps idf positive even for terms present in every document.
    return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

// SparseEncoder implementation

SparseEncoder::SparseEncoder(const SparseEncoderParams& params)
    : params_(params)
    , buckets_(static_cast<std::uint32_t>(params.bucket_count)) {
    if (params_.threads == 0) params_.threads = 1;
}

auto SparseEncoder::create(const SparseEncoderParams& params)
    -> std::expected<SparseEncoder, core::error> {
    if (auto ok = validate_params(params); !ok) {
        return std::unexpected(ok.error());
    }
    return SparseEncoder(params);
}

auto SparseEncoder::hash_term(std::string_view term) noexcept -> std::uint32_t {
    std::uint32_t h = 2166136261u;
    for (unsigned char c : term) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

auto SparseEncoder::bucket_of(std::string_view term) const noexcept -> std::uint32_t {
    return hash_term(term) % buckets_;
}

auto SparseEncoder::count_terms(std::string_view text) -> DocumentTerms {
    auto tokens = text::Tokenizer::tokenize(text);

    DocumentTerms doc;
    doc.length = static_cast<std::uint32_t>(tokens.size());
    for (auto& token : tokens) {
        doc.term_freqs[std::move(token)]++;
    }
    return doc;
}

auto SparseEncoder::compute_stats(const std::vector<DocumentTerms>& docs) -> CorpusStats {
    CorpusStats stats;
    stats.num_documents = docs.size();

    std::size_t total_tokens = 0;
    for (const auto& doc : docs) {
        total_tokens += doc.length;
        // Presence, not occurrences: each key appears once per document.
        for (const auto& [term, tf] : doc.term_freqs) {
            stats.doc_freqs[term]++;
        }
    }

    if (!docs.empty() && total_tokens > 0) {
        stats.avg_doc_length = static_cast<double>(total_tokens) / static_cast<double>(docs.size());
    } else {
        stats.avg_doc_length = 1.0;
    }
    return stats;
}

auto SparseEncoder::score_document(const DocumentTerms& doc, const CorpusStats& stats) const
    -> TermBucketVector {
    BucketAccumulator acc(buckets_);
    return score_into(acc, *this, doc, stats);
}

auto SparseEncoder::encode_query(std::string_view text) const -> TermBucketVector {
    BucketAccumulator acc(buckets_);
    for (const auto& token : text::Tokenizer::tokenize(text)) {
        acc.add(bucket_of(token), 1.0f);
    }
    return acc.drain();
}

auto SparseEncoder::encode_corpus(const std::vector<std::string>& documents) const
    -> std::expected<std::vector<TermBucketVector>, core::error> {
    const auto t0 = std::chrono::steady_clock::now();

    // Pass 1: term counts, then the corpus-wide reduction.
    std::vector<DocumentTerms> docs;
    docs.reserve(documents.size());
    for (const auto& text : documents) {
        docs.push_back(count_terms(text));
    }
    const CorpusStats stats = compute_stats(docs);

    // Pass 2: per-document scoring against the finished stats.
    std::vector<TermBucketVector> out(documents.size());
    const std::size_t n = documents.size();
    const std::size_t workers = std::min<std::size_t>(params_.threads, std::max<std::size_t>(n, 1));

    auto score_range = [&](std::size_t begin, std::size_t end) {
        BucketAccumulator acc(buckets_);
        for (std::size_t i = begin; i < end; ++i) {
            out[i] = score_into(acc, *this, docs[i], stats);
        }
    };

    if (workers <= 1) {
        score_range(0, n);
    } else {
        const std::size_t chunk = (n + workers - 1) / workers;
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (std::size_t begin = 0; begin < n; begin += chunk) {
            const std::size_t end = std::min(n, begin + chunk);
            futures.push_back(std::async(std::launch::async, score_range, begin, end));
        }
        for (auto& f : futures) {
            f.get();
        }
    }

    if (core::debug_enabled()) {
        const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[sparse] encoded " << n << " documents, vocabulary=" << stats.doc_freqs.size()
                  << " avg_len=" << stats.avg_doc_length << " runtime_sec=" << secs << "\n";
    }

    return out;
}

// Free-function forms

auto encode_corpus(const std::vector<std::string>& documents, std::int64_t bucket_count,
                   float k1, float b)
    -> std::expected<std::vector<TermBucketVector>, core::error> {
    SparseEncoderParams params;
    params.bucket_count = bucket_count;
    params.bm25.k1 = k1;
    params.bm25.b = b;

    auto encoder = SparseEncoder::create(params);
    if (!encoder) {
        return std::unexpected(encoder.error());
    }
    return encoder->encode_corpus(documents);
}

auto encode_query(std::string_view text, std::int64_t bucket_count)
    -> std::expected<TermBucketVector, core::error> {
    SparseEncoderParams params;
    params.bucket_count = bucket_count;

    auto encoder = SparseEncoder::create(params);
    if (!encoder) {
        return std::unexpected(encoder.error());
    }
    return encoder->encode_query(text);
}

} // namespace veclex::index
