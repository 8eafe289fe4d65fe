#pragma once

/** \file service.hpp
 *  \brief Collaborator interfaces: record sources, embedders and the vector-search service.
 *
 * The core never talks to a network directly. Deployments plug in
 * implementations of these interfaces; tests use in-memory fakes. Errors from
 * an implementation are passed back to callers unchanged.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "veclex/error.hpp"
#include "veclex/index/datapoint.hpp"
#include "veclex/index/restriction.hpp"
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/record.hpp"

namespace veclex {

/** \brief Supplier of raw records for an ingest batch. */
class RecordSource {
public:
    virtual ~RecordSource() = default;

    /** \brief Fetch the whole batch; order is preserved through ingest. */
    virtual auto fetch() -> std::expected<std::vector<Record>, core::error> = 0;

    /** \brief Records dropped by the last fetch as unreadable. */
    [[nodiscard]] virtual auto skipped() const noexcept -> std::size_t { return 0; }
};

/** \brief Records read from a local line-delimited JSON file. */
class JsonlRecordSource final : public RecordSource {
public:
    explicit JsonlRecordSource(std::filesystem::path path) : path_(std::move(path)) {}

    auto fetch() -> std::expected<std::vector<Record>, core::error> override;
    [[nodiscard]] auto skipped() const noexcept -> std::size_t override { return skipped_; }

private:
    std::filesystem::path path_;
    std::size_t skipped_{0};
};

/** \brief Embedding task hint passed to the model. */
enum class EmbedTask : std::uint8_t {
    retrieval_document,
    retrieval_query,
};

/** \brief Wire name of a task, e.g. "RETRIEVAL_DOCUMENT". */
constexpr const char* to_string(EmbedTask task) noexcept {
    switch (task) {
        case EmbedTask::retrieval_document: return "RETRIEVAL_DOCUMENT";
        case EmbedTask::retrieval_query: return "RETRIEVAL_QUERY";
    }
    return "RETRIEVAL_DOCUMENT";
}

/** \brief Dense embedding model. */
class DenseEmbedder {
public:
    virtual ~DenseEmbedder() = default;

    /** \brief One vector of length \p dimension per input text, in input order. */
    virtual auto embed(const std::vector<std::string>& texts, EmbedTask task, std::size_t dimension)
        -> std::expected<std::vector<std::vector<float>>, core::error> = 0;
};

/** \brief One nearest-neighbor request. */
struct NeighborQuery {
    std::vector<float> dense;
    std::optional<index::TermBucketVector> sparse;
    std::size_t k{10};
    std::vector<index::Restriction> filters;
};

/** \brief Remote index holding IndexEntries. */
class VectorSearchService {
public:
    virtual ~VectorSearchService() = default;

    /** \brief Insert or replace entries by id. */
    virtual auto upsert(const std::vector<index::IndexEntry>& entries)
        -> std::expected<void, core::error> = 0;

    /** \brief Remove entries by id; unknown ids are ignored. */
    virtual auto remove(const std::vector<std::string>& ids)
        -> std::expected<void, core::error> = 0;

    /** \brief Rebuild or extend the index from the batch files under a prefix. */
    virtual auto update_from_prefix(const std::string& prefix, bool complete_overwrite)
        -> std::expected<void, core::error> = 0;

    /** \brief Raw neighbor objects as returned by the service, best first. */
    virtual auto find_neighbors(const NeighborQuery& query)
        -> std::expected<std::vector<nlohmann::json>, core::error> = 0;
};

} // namespace veclex
