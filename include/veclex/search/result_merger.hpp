#pragma once

/** \file result_merger.hpp
 *  \brief Query encoding, neighbor normalization and metadata backfill.
 *
 * One search call runs three stages:
 *  1. encode: text is embedded (and L2-normalized) or a raw vector is taken
 *     as given; hybrid queries also get a query-mode sparse vector;
 *  2. normalize: raw neighbors become NeighborResults (see neighbor.hpp);
 *  3. backfill: results without metadata are filled from the metadata store.
 *
 * Backfill scans line-delimited index entries under a prefix and stops as
 * soon as every requested id is found. Metadata already present on a result
 * is never replaced.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "veclex/error.hpp"
#include "veclex/index/restriction.hpp"
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/io/blob_store.hpp"
#include "veclex/record.hpp"
#include "veclex/search/neighbor.hpp"
#include "veclex/service.hpp"

namespace veclex::search {

/** \brief Similarity used by the deployed index; fixes score ordering. */
enum class DistanceMeasure {
    DOT_PRODUCT,   /**< higher is closer */
    COSINE,        /**< higher is closer */
    L2_NORM        /**< lower is closer */
};

/** \brief Wire name, e.g. "DOT_PRODUCT_DISTANCE". */
auto to_string(DistanceMeasure m) noexcept -> const char*;

/** \brief Parse "DOT_PRODUCT", "COSINE" or "L2_NORM" (an optional "_DISTANCE" suffix is accepted). */
auto parse_distance_measure(std::string_view name) -> std::optional<DistanceMeasure>;

/** \brief True when a larger score means a closer neighbor. */
constexpr auto higher_is_closer(DistanceMeasure m) noexcept -> bool {
    return m != DistanceMeasure::L2_NORM;
}

/** \brief A search request. Exactly one of text and vector is set. */
struct SearchQuery {
    std::optional<std::string> text;
    std::optional<std::vector<float>> vector;
    bool hybrid{false};                          /**< also send a sparse query vector */
    std::size_t top_k{10};
    std::vector<index::Restriction> filters;
    std::optional<std::string> metadata_prefix;  /**< overrides the configured store prefix */
};

/** \brief Map a request payload onto a SearchQuery.
 *
 * Payload members: "query_type" ("text" | "vector", default "vector"),
 * "query", "top_k", "use_bm25", "restricts", "metadata_prefix".
 *
 * \return Query, or invalid_argument for wrong types, an unknown query type,
 *         a non-positive top_k or malformed restricts
 */
auto parse_search_request(const nlohmann::json& payload, std::size_t default_top_k = 10)
    -> std::expected<SearchQuery, core::error>;

/** \brief Query vectors ready for the service. */
struct EncodedQuery {
    std::vector<float> dense;
    std::optional<index::TermBucketVector> sparse;
};

/** \brief Build query vectors.
 *
 * \param query Request; text and vector are mutually exclusive
 * \param embedder Used for text queries only
 * \param dimension Expected dense dimension
 * \param sparse Query-mode encoder; required when query.hybrid is set
 * \return Vectors, or invalid_argument for mixed/empty input or hybrid without
 *         text, precondition_failed for a dimension mismatch or a missing encoder;
 *         embedder errors are returned unchanged
 */
auto encode_search_query(const SearchQuery& query,
                         DenseEmbedder& embedder,
                         std::size_t dimension,
                         const index::SparseEncoder* sparse)
    -> std::expected<EncodedQuery, core::error>;

/** \brief Backfill tuning. */
struct BackfillOptions {
    std::size_t parallelism{1};  /**< concurrent blob scans; 1 scans sequentially */
};

/** \brief Counters of one backfill. */
struct BackfillStats {
    std::size_t requested{0};      /**< ids lacking metadata */
    std::size_t found{0};          /**< ids resolved by the scan */
    std::size_t applied{0};        /**< results that received metadata */
    std::size_t blobs_listed{0};
    std::size_t blobs_scanned{0};
    std::size_t lines_scanned{0};
    std::size_t skipped_lines{0};  /**< malformed or non-object lines */
    bool complete{false};          /**< scan stopped early with every id found */
};

using MetadataLookup = std::unordered_map<std::string, Metadata>;

/** \brief Ids of results that still lack metadata. */
auto missing_metadata_ids(const std::vector<NeighborResult>& results)
    -> std::unordered_set<std::string>;

/** \brief Copy looked-up metadata onto results lacking it; returns the number applied. */
auto apply_metadata(std::vector<NeighborResult>& results, const MetadataLookup& lookup) -> std::size_t;

/** \brief Id to metadata lookup built by scanning a metadata store prefix. */
class MetadataBackfill {
public:
    MetadataBackfill(const io::BlobStore& store, std::string prefix, BackfillOptions options = {});

    /** \brief Scan for the given ids; stops once all are found.
     *
     * Records carry metadata under "embedding_metadata" (or "metadata").
     * Records without it do not satisfy an id.
     */
    auto lookup(const std::unordered_set<std::string>& ids, BackfillStats* stats = nullptr) const
        -> std::expected<MetadataLookup, core::error>;

    /** \brief Fill results lacking metadata; a no-op when none do. */
    auto apply(std::vector<NeighborResult>& results) const
        -> std::expected<BackfillStats, core::error>;

    [[nodiscard]] auto prefix() const noexcept -> const std::string& { return prefix_; }

private:
    const io::BlobStore& store_;
    std::string prefix_;
    BackfillOptions options_;
};

} // namespace veclex::search
