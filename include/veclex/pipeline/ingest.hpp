#pragma once

/** \file ingest.hpp
 *  \brief Ingest operations: embed a record batch, stream updates and deletes, batch rebuild.
 *
 * embed_data runs the whole write path:
 *   records -> text -> dense vectors (+ BM25 sparse vectors) -> projection
 *           -> IndexEntries -> "<prefix>/part-00000.json"
 *
 * A batch either succeeds with skip counts or fails with a single error that
 * names the failing stage in its component.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "veclex/config/app_config.hpp"
#include "veclex/error.hpp"
#include "veclex/io/blob_store.hpp"
#include "veclex/record.hpp"
#include "veclex/service.hpp"

namespace veclex::pipeline {

/** \brief Name of the single output object written under the prefix. */
inline constexpr const char* kPartFileName = "part-00000.json";

struct EmbedOptions {
    std::string output_prefix;                 /**< empty: batch_paths.batch_root */
    std::optional<std::size_t> dimension;      /**< empty: embedding.output_dimensionality */
    std::optional<std::string> vector_field;   /**< read pre-computed vectors from this record field */
    std::string id_field{"id"};
};

struct EmbedReport {
    std::size_t row_count{0};
    std::string output_prefix;
    std::string output_file;
    std::size_t skipped_records{0};   /**< unreadable source records */
    std::size_t skipped_values{0};    /**< numeric restrict values dropped */
    std::size_t sparse_entries{0};    /**< entries carrying a sparse vector */
};

struct UpdateReport {
    std::size_t upserted{0};
    std::size_t blobs_read{0};
};

struct DeleteReport {
    std::size_t deleted{0};
};

struct BatchUpdateReport {
    std::string prefix;
    std::vector<std::string> files;
    bool complete_overwrite{false};
};

/** \brief Write-side operations over the configured collaborators.
 *
 * Collaborators are borrowed; operations that need one that was not supplied
 * fail with precondition_failed.
 */
class IngestPipeline {
public:
    IngestPipeline(const config::AppConfig& cfg,
                   io::BlobStore& store,
                   VectorSearchService* service = nullptr,
                   DenseEmbedder* embedder = nullptr);

    /** \brief Embed every record of a source and write one batch file. */
    auto embed_data(RecordSource& source, const EmbedOptions& options = {})
        -> std::expected<EmbedReport, core::error>;

    /** \brief Parse entry objects and upsert them; any malformed entry fails the call. */
    auto streaming_update(const std::vector<nlohmann::json>& items)
        -> std::expected<UpdateReport, core::error>;

    /** \brief Upsert every entry stored under a prefix. */
    auto streaming_update_from_prefix(const std::string& prefix)
        -> std::expected<UpdateReport, core::error>;

    /** \brief Remove entries by id; an empty list is invalid_argument. */
    auto streaming_delete(const std::vector<std::string>& ids)
        -> std::expected<DeleteReport, core::error>;

    /** \brief Rebuild the index from batch files under a prefix (empty: batch_root).
     *
     * \return Listed files, or not_found when the prefix holds no files
     */
    auto batch_update(const std::string& prefix, bool complete_overwrite)
        -> std::expected<BatchUpdateReport, core::error>;

private:
    auto build_entries(const std::vector<Record>& records, const EmbedOptions& options,
                       EmbedReport& report)
        -> std::expected<std::vector<index::IndexEntry>, core::error>;

    const config::AppConfig& cfg_;
    io::BlobStore& store_;
    VectorSearchService* service_;
    DenseEmbedder* embedder_;
};

} // namespace veclex::pipeline
