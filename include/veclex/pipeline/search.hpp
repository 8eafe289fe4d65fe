#pragma once

/** \file search.hpp
 *  \brief Read path: encode a query, ask the service, normalize and backfill.
 */

#include <expected>
#include <string>
#include <vector>

#include "veclex/config/app_config.hpp"
#include "veclex/error.hpp"
#include "veclex/io/blob_store.hpp"
#include "veclex/search/neighbor.hpp"
#include "veclex/search/result_merger.hpp"
#include "veclex/service.hpp"

namespace veclex::pipeline {

/** \brief Results of one search call. */
struct SearchResponse {
    std::string query_type;                      /**< "text" or "vector" */
    nlohmann::json query;                        /**< echo of the query text or vector */
    std::vector<search::NeighborResult> results;
    search::BackfillStats backfill;

    /** \brief {"query", "query_type", "num_recommendations", "results"}. */
    [[nodiscard]] auto to_json() const -> nlohmann::json;
};

class SearchPipeline {
public:
    /** \param metadata_store Store scanned for missing metadata; may be null to disable backfill. */
    SearchPipeline(const config::AppConfig& cfg,
                   DenseEmbedder& embedder,
                   VectorSearchService& service,
                   const io::BlobStore* metadata_store = nullptr);

    auto search(const search::SearchQuery& query) -> std::expected<SearchResponse, core::error>;

    /** \brief parse_search_request followed by search. */
    auto search(const nlohmann::json& payload) -> std::expected<SearchResponse, core::error>;

private:
    const config::AppConfig& cfg_;
    DenseEmbedder& embedder_;
    VectorSearchService& service_;
    const io::BlobStore* metadata_store_;
};

} // namespace veclex::pipeline
