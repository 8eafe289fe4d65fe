#pragma once

/** \file sparse_encoder.hpp
 *  \brief BM25 sparse encoding over a hashed term-bucket space.
 *
 * Terms are hashed into a fixed number of buckets, so the sparse dimension is
 * bounded regardless of vocabulary size. Colliding terms merge additively.
 *
 * Two modes share one bucketing rule:
 * - Corpus mode: BM25 weights (idf and length normalization) computed against
 *   statistics of the whole batch.
 * - Query mode: raw term frequencies. Corpus statistics are not available at
 *   query time; the document/query asymmetry is intentional.
 *
 * Corpus encoding runs in two passes. The first pass counts terms and reduces
 * them into an immutable CorpusStats; only then does the per-document scoring
 * pass start. Scoring workers share nothing but the read-only stats.
 *
 * Thread-safety: a SparseEncoder is immutable after creation; all methods are
 * const and safe for concurrent calls.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "veclex/error.hpp"

namespace veclex::index {

/** \brief Sparse vector over term buckets (parallel dimension/value lists). */
struct TermBucketVector {
    std::vector<std::uint32_t> dimensions;  /**< Bucket indices, unique */
    std::vector<float> values;              /**< Weights, same length as dimensions */

    /** \brief Get number of stored elements. */
    auto nnz() const noexcept -> std::size_t { return dimensions.size(); }

    /** \brief Check if vector is empty. */
    auto empty() const noexcept -> bool { return dimensions.empty(); }

    /** \brief True if at least one stored weight is non-zero. */
    auto has_signal() const noexcept -> bool;

    /** \brief Check structural invariants against a bucket space.
     *
     * \param bucket_count Size of the bucket space (0 skips the range check)
     * \return True if lengths match, indices are unique and in range
     */
    auto is_valid(std::uint32_t bucket_count = 0) const -> bool;

    auto operator==(const TermBucketVector&) const -> bool = default;
};

/** \brief BM25 scoring parameters. */
struct BM25Params {
    float k1{1.2f};   /**< Term frequency saturation (must be > 0) */
    float b{0.75f};   /**< Length normalization in [0, 1] */
};

/** \brief Sparse encoder configuration. */
struct SparseEncoderParams {
    std::int64_t bucket_count{30000};  /**< Size of the hashed bucket space */
    BM25Params bm25;                   /**< Corpus-mode weighting */
    std::uint32_t threads{1};          /**< Scoring workers for corpus mode */
};

/** \brief Term counts of one tokenized document. */
struct DocumentTerms {
    std::uint32_t length{0};                                   /**< Token count */
    std::unordered_map<std::string, std::uint32_t> term_freqs; /**< term -> occurrences */
};

/** \brief Corpus-wide statistics, computed once per batch. */
struct CorpusStats {
    std::size_t num_documents{0};                             /**< N */
    double avg_doc_length{1.0};                               /**< Mean tokens per document, never 0 */
    std::unordered_map<std::string, std::uint32_t> doc_freqs; /**< term -> documents containing it */

    /** \brief Inverse document frequency, ln((N - df + 0.5)/(df + 0.5) + 1). */
    auto idf(const std::string& term) const -> double;
};

/** \brief Hashed BM25 sparse encoder.
 *
 * Example usage:
 * ```cpp
 * SparseEncoderParams params;
 * params.bucket_count = 8;
 * auto encoder = SparseEncoder::create(params);
 * auto vecs = encoder->encode_corpus({"cat dog", "cat cat", ""});
 * auto q = encoder->encode_query("cat");
 * ```
 */
class SparseEncoder {
public:
    /** \brief Create an encoder.
     *
     * Preconditions: 0 < bucket_count <= UINT32_MAX; k1 > 0; 0 <= b <= 1
     * \return Encoder or invalid_argument
     */
    static auto create(const SparseEncoderParams& params)
        -> std::expected<SparseEncoder, core::error>;

    /** \brief Encode a batch of documents with BM25 weights.
     *
     * \param documents Document texts
     * \return One vector per document, same order; empty documents give empty vectors
     *
     * Complexity: O(T + N * U) where T is total tokens and U unique terms per document
     */
    auto encode_corpus(const std::vector<std::string>& documents) const
        -> std::expected<std::vector<TermBucketVector>, core::error>;

    /** \brief Encode a query with raw term-frequency weights. */
    auto encode_query(std::string_view text) const -> TermBucketVector;

    /** \brief Count terms of one document (first pass). */
    static auto count_terms(std::string_view text) -> DocumentTerms;

    /** \brief Reduce per-document counts into corpus statistics (the barrier). */
    static auto compute_stats(const std::vector<DocumentTerms>& docs) -> CorpusStats;

    /** \brief Score one document against finished corpus statistics. */
    auto score_document(const DocumentTerms& doc, const CorpusStats& stats) const
        -> TermBucketVector;

    /** \brief Bucket index of a term: hash(term) mod bucket_count. */
    auto bucket_of(std::string_view term) const noexcept -> std::uint32_t;

    /** \brief 32-bit FNV-1a hash of the term bytes; stable across runs. */
    static auto hash_term(std::string_view term) noexcept -> std::uint32_t;

    auto params() const noexcept -> const SparseEncoderParams& { return params_; }
    auto bucket_count() const noexcept -> std::uint32_t { return buckets_; }

private:
    explicit SparseEncoder(const SparseEncoderParams& params);

    SparseEncoderParams params_;
    std::uint32_t buckets_{0};
};

/** \brief One-shot corpus encoding with explicit parameters.
 *
 * Fails with invalid_argument when bucket_count <= 0.
 */
auto encode_corpus(const std::vector<std::string>& documents, std::int64_t bucket_count,
                   float k1 = 1.2f, float b = 0.75f)
    -> std::expected<std::vector<TermBucketVector>, core::error>;

/** \brief One-shot query encoding; fails with invalid_argument when bucket_count <= 0. */
auto encode_query(std::string_view text, std::int64_t bucket_count)
    -> std::expected<TermBucketVector, core::error>;

} // namespace veclex::index
