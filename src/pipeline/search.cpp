#include "veclex/pipeline/search.hpp"

#include <chrono>
#include <iostream>
#include <optional>

#include "veclex/core/platform_utils.hpp"
#include "veclex/index/sparse_encoder.hpp"

namespace veclex::pipeline {

auto SearchResponse::to_json() const -> nlohmann::json {
    nlohmann::json out = nlohmann::json::object();
    out["query"] = query;
    out["query_type"] = query_type;
    out["num_recommendations"] = results.size();
    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : results) items.push_back(search::to_json(r));
    out["results"] = std::move(items);
    return out;
}

SearchPipeline::SearchPipeline(const config::AppConfig& cfg,
                               DenseEmbedder& embedder,
                               VectorSearchService& service,
                               const io::BlobStore* metadata_store)
    : cfg_(cfg), embedder_(embedder), service_(service), metadata_store_(metadata_store) {}

auto SearchPipeline::search(const nlohmann::json& payload) -> std::expected<SearchResponse, core::error> {
    auto query = search::parse_search_request(payload, cfg_.search.top_k);
    if (!query) return std::unexpected(query.error());
    return search(*query);
}

auto SearchPipeline::search(const search::SearchQuery& query) -> std::expected<SearchResponse, core::error> {
    const auto start = std::chrono::steady_clock::now();
    const bool debug = core::debug_enabled();

    std::optional<index::SparseEncoder> encoder;
    if (query.hybrid && cfg_.sparse.enabled) {
        auto created = index::SparseEncoder::create(cfg_.sparse_params());
        if (!created) return std::unexpected(created.error());
        encoder.emplace(std::move(*created));
    }
    auto encoded = search::encode_search_query(query, embedder_, cfg_.embedding.output_dimensionality,
                                               encoder ? &*encoder : nullptr);
    if (!encoded) return std::unexpected(encoded.error());

    NeighborQuery nq;
    nq.dense = std::move(encoded->dense);
    nq.sparse = std::move(encoded->sparse);
    nq.k = query.top_k;
    nq.filters = query.filters;

    const auto neighbors_start = std::chrono::steady_clock::now();
    auto raw = service_.find_neighbors(nq);
    if (!raw) return std::unexpected(raw.error());
    if (debug) {
        std::cerr << "[search] find_neighbors runtime_sec="
                  << std::chrono::duration<double>(std::chrono::steady_clock::now() - neighbors_start).count()
                  << "\n";
    }

    auto results = search::normalize_neighbors(*raw);
    if (!results) return std::unexpected(results.error());

    SearchResponse response;
    response.query_type = query.text ? "text" : "vector";
    response.query = query.text ? nlohmann::json(*query.text) : nlohmann::json(*query.vector);
    response.results = std::move(*results);

    const std::string prefix = query.metadata_prefix.value_or(cfg_.batch_paths.batch_root);
    if (metadata_store_ != nullptr && !prefix.empty()) {
        search::BackfillOptions options;
        options.parallelism = cfg_.search.backfill_parallelism;
        search::MetadataBackfill backfill(*metadata_store_, prefix, options);
        auto stats = backfill.apply(response.results);
        if (!stats) return std::unexpected(stats.error());
        response.backfill = *stats;
    }

    if (debug) {
        std::cerr << "[search] results=" << response.results.size()
                  << " backfilled=" << response.backfill.applied
                  << " measure=" << search::to_string(cfg_.search.distance_measure)
                  << " runtime_sec="
                  << std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count() << "\n";
    }
    return response;
}

} // namespace veclex::pipeline
