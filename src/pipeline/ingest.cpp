#include "veclex/pipeline/ingest.hpp"

#include <chrono>
#include <iostream>
#include <unordered_set>

#include "veclex/core/platform_utils.hpp"
#include "veclex/index/datapoint.hpp"
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/io/jsonl.hpp"
#include "veclex/kernels/normalize.hpp"
#include "veclex/metadata/record_projector.hpp"

namespace veclex::pipeline {

namespace {

auto seconds_since(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

auto missing_collaborator(const char* what, const char* component) -> core::error {
    return core::error{core::error_code::precondition_failed,
        std::string(what) + " is not configured", component};
}

// Dense vectors read from a record field instead of the embedder.
auto vectors_from_field(const std::vector<Record>& records, const std::string& field)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
    std::vector<std::vector<float>> rows;
    rows.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        const auto it = r.is_object() ? r.find(field) : r.end();
        if (!r.is_object() || it == r.end() || !it->is_array()) {
            return std::unexpected(core::error{core::error_code::invalid_argument,
                "record " + std::to_string(i) + " has no vector field '" + field + "'", "ingest.embed"});
        }
        std::vector<float> v;
        v.reserve(it->size());
        for (const auto& x : *it) {
            if (!x.is_number()) {
                return std::unexpected(core::error{core::error_code::invalid_argument,
                    "record " + std::to_string(i) + " field '" + field + "' must hold numbers", "ingest.embed"});
            }
            v.push_back(x.get<float>());
        }
        rows.push_back(std::move(v));
    }
    return rows;
}

} // anonymous namespace

IngestPipeline::IngestPipeline(const config::AppConfig& cfg,
                               io::BlobStore& store,
                               VectorSearchService* service,
                               DenseEmbedder* embedder)
    : cfg_(cfg), store_(store), service_(service), embedder_(embedder) {}

auto IngestPipeline::build_entries(const std::vector<Record>& records, const EmbedOptions& options,
                                   EmbedReport& report)
    -> std::expected<std::vector<index::IndexEntry>, core::error> {
    using core::error; using core::error_code;
    const auto selection = cfg_.field_selection();
    const std::size_t dimension = options.dimension.value_or(cfg_.embedding.output_dimensionality);
    if (dimension == 0) {
        return std::unexpected(error{error_code::invalid_argument, "dimension must be positive", "ingest.embed"});
    }

    std::vector<std::string> raw_texts;
    std::vector<std::string> texts;
    raw_texts.reserve(records.size());
    texts.reserve(records.size());
    for (const auto& r : records) {
        raw_texts.push_back(metadata::build_text(r, selection.text_fields));
        texts.push_back(metadata::as_nonempty_text(raw_texts.back()));
    }

    // Dense vectors
    const auto embed_start = std::chrono::steady_clock::now();
    std::expected<std::vector<std::vector<float>>, core::error> dense;
    if (options.vector_field) {
        dense = vectors_from_field(records, *options.vector_field);
    } else if (embedder_ == nullptr) {
        return std::unexpected(missing_collaborator("dense embedder", "ingest.embed"));
    } else if (!records.empty()) {
        dense = embedder_->embed(texts, EmbedTask::retrieval_document, dimension);
    }
    if (!dense) return std::unexpected(dense.error());
    if (dense->size() != records.size()) {
        return std::unexpected(error{error_code::precondition_failed,
            "embedder returned " + std::to_string(dense->size()) + " vectors for " +
            std::to_string(records.size()) + " records", "ingest.embed"});
    }
    for (std::size_t i = 0; i < dense->size(); ++i) {
        if ((*dense)[i].size() != dimension) {
            return std::unexpected(error{error_code::precondition_failed,
                "record " + std::to_string(i) + " vector dimension " + std::to_string((*dense)[i].size()) +
                " != " + std::to_string(dimension), "ingest.embed"});
        }
    }
    kernels::l2_normalize_rows(*dense);
    if (core::debug_enabled()) {
        std::cerr << "[ingest] dense rows=" << dense->size() << " dim=" << dimension;
        if (options.vector_field) {
            std::cerr << " source=field:" << *options.vector_field;
        } else {
            std::cerr << " model=" << cfg_.embedding.model_name
                      << " task=" << to_string(EmbedTask::retrieval_document);
        }
        std::cerr << " runtime_sec=" << seconds_since(embed_start) << "\n";
    }

    // Sparse vectors over the whole batch
    std::vector<index::TermBucketVector> sparse;
    if (cfg_.sparse.enabled) {
        auto encoder = index::SparseEncoder::create(cfg_.sparse_params());
        if (!encoder) return std::unexpected(encoder.error());
        auto encoded = encoder->encode_corpus(raw_texts);
        if (!encoded) return std::unexpected(encoded.error());
        sparse = std::move(*encoded);
    }

    std::vector<index::IndexEntry> entries;
    std::unordered_set<std::string> seen_ids;
    entries.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        auto p = metadata::project(r, selection);
        report.skipped_values += p.skipped_values;

        const nlohmann::json id = (r.is_object() && r.contains(options.id_field)) ? r[options.id_field] : nlohmann::json();
        std::optional<index::TermBucketVector> sv;
        if (!sparse.empty()) sv = std::move(sparse[i]);

        auto entry = index::assemble(id, std::move((*dense)[i]), std::move(sv),
                                     std::move(p.restricts), std::move(p.numeric_restricts),
                                     std::move(p.metadata));
        if (!entry) return std::unexpected(entry.error());
        if (!seen_ids.insert(entry->id).second) {
            return std::unexpected(error{error_code::invalid_argument,
                "duplicate id " + entry->id + " at record " + std::to_string(i), "index.assemble"});
        }
        if (entry->sparse_vector) ++report.sparse_entries;
        entries.push_back(std::move(*entry));
    }
    return entries;
}

auto IngestPipeline::embed_data(RecordSource& source, const EmbedOptions& options)
    -> std::expected<EmbedReport, core::error> {
    using core::error; using core::error_code;
    const auto start = std::chrono::steady_clock::now();

    EmbedReport report;
    report.output_prefix = options.output_prefix.empty() ? cfg_.batch_paths.batch_root : options.output_prefix;
    if (report.output_prefix.empty()) {
        return std::unexpected(error{error_code::invalid_argument,
            "output prefix is required for embedding output", "ingest.write"});
    }
    // Reject unusable prefixes before any external call.
    if (auto key = io::to_object_key(report.output_prefix); !key) {
        return std::unexpected(key.error());
    }

    auto records = source.fetch();
    if (!records) return std::unexpected(records.error());
    report.skipped_records = source.skipped();
    report.row_count = records->size();

    auto entries = build_entries(*records, options, report);
    if (!entries) return std::unexpected(entries.error());

    std::vector<nlohmann::json> lines;
    lines.reserve(entries->size());
    for (const auto& e : *entries) lines.push_back(index::to_json(e));

    report.output_file = io::join_object_name(report.output_prefix, kPartFileName);
    auto written = store_.write(report.output_file, io::write_lines(lines));
    if (!written) return std::unexpected(written.error());

    if (core::debug_enabled()) {
        std::cerr << "[ingest] embed rows=" << report.row_count
                  << " sparse=" << report.sparse_entries
                  << " skipped_records=" << report.skipped_records
                  << " skipped_values=" << report.skipped_values
                  << " out=" << report.output_file
                  << " runtime_sec=" << seconds_since(start) << "\n";
    }
    return report;
}

auto IngestPipeline::streaming_update(const std::vector<nlohmann::json>& items)
    -> std::expected<UpdateReport, core::error> {
    if (service_ == nullptr) return std::unexpected(missing_collaborator("vector search service", "ingest.upsert"));
    std::vector<index::IndexEntry> entries;
    std::unordered_set<std::string> seen_ids;
    entries.reserve(items.size());
    for (const auto& item : items) {
        auto e = index::parse(item);
        if (!e) return std::unexpected(e.error());
        if (!seen_ids.insert(e->id).second) {
            return std::unexpected(core::error{core::error_code::invalid_argument,
                "duplicate datapoint id " + e->id + " in update batch", "index.assemble"});
        }
        entries.push_back(std::move(*e));
    }
    auto r = service_->upsert(entries);
    if (!r) return std::unexpected(r.error());
    UpdateReport report;
    report.upserted = entries.size();
    return report;
}

auto IngestPipeline::streaming_update_from_prefix(const std::string& prefix)
    -> std::expected<UpdateReport, core::error> {
    using core::error; using core::error_code;
    if (prefix.empty()) {
        return std::unexpected(error{error_code::invalid_argument, "datapoint prefix is required", "ingest.upsert"});
    }
    auto names = store_.list(prefix);
    if (!names) return std::unexpected(names.error());

    std::vector<nlohmann::json> items;
    std::size_t blobs = 0;
    for (const auto& name : *names) {
        auto content = store_.read(name);
        if (!content) return std::unexpected(content.error());
        ++blobs;
        const auto stats = io::for_each_object(*content, [&items](nlohmann::json&& item) {
            items.push_back(std::move(item));
            return true;
        });
        if (stats.skipped != 0) {
            return std::unexpected(error{error_code::data_integrity,
                std::to_string(stats.skipped) + " malformed line(s) in " + name, "ingest.upsert"});
        }
        if (core::debug_enabled()) {
            std::cerr << "[ingest] loaded " << stats.objects << " lines from " << name << "\n";
        }
    }
    auto report = streaming_update(items);
    if (report) report->blobs_read = blobs;
    return report;
}

auto IngestPipeline::streaming_delete(const std::vector<std::string>& ids)
    -> std::expected<DeleteReport, core::error> {
    if (ids.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "datapoint ids must not be empty", "ingest.delete"});
    }
    if (service_ == nullptr) return std::unexpected(missing_collaborator("vector search service", "ingest.delete"));
    auto r = service_->remove(ids);
    if (!r) return std::unexpected(r.error());
    return DeleteReport{ids.size()};
}

auto IngestPipeline::batch_update(const std::string& prefix, bool complete_overwrite)
    -> std::expected<BatchUpdateReport, core::error> {
    using core::error; using core::error_code;
    BatchUpdateReport report;
    report.prefix = prefix.empty() ? cfg_.batch_paths.batch_root : prefix;
    report.complete_overwrite = complete_overwrite;
    if (report.prefix.empty()) {
        return std::unexpected(error{error_code::invalid_argument,
            "contents prefix is required for batch update", "ingest.batch"});
    }
    if (auto key = io::to_object_key(report.prefix); !key) return std::unexpected(key.error());
    if (service_ == nullptr) return std::unexpected(missing_collaborator("vector search service", "ingest.batch"));

    auto files = store_.list(report.prefix);
    if (!files) return std::unexpected(files.error());
    if (files->empty()) {
        return std::unexpected(error{error_code::not_found, "no files found in " + report.prefix, "ingest.batch"});
    }
    report.files = std::move(*files);
    if (core::debug_enabled()) {
        std::cerr << "[ingest] batch update using " << report.files.size() << " file(s) under "
                  << report.prefix << "\n";
    }
    auto r = service_->update_from_prefix(report.prefix, complete_overwrite);
    if (!r) return std::unexpected(r.error());
    return report;
}

} // namespace veclex::pipeline
