#pragma once

/** \file app_config.hpp
 *  \brief Process configuration loaded from a JSON file.
 *
 * Loaded once and treated as immutable for the duration of a batch or query.
 * Missing keys take the defaults below; present keys with the wrong type or an
 * out-of-range value fail the load with config_invalid.
 *
 * Environment:
 * - VECLEX_CONFIG      path used by load_config() without an argument
 * - VECLEX_BATCH_ROOT  overrides batch_paths.batch_root
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "veclex/error.hpp"
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/metadata/record_projector.hpp"
#include "veclex/search/result_merger.hpp"

namespace veclex::config {

struct FilterConfig {
    std::vector<std::string> restricts_fields;
    std::vector<std::string> numeric_restricts_fields;
    std::vector<std::string> timestamp_fields{"created_at", "updated_at"};
};

struct EmbeddingConfig {
    std::vector<std::string> text_fields;
    std::vector<std::string> metadata_fields;
    std::size_t output_dimensionality{768};
    std::string model_name{"gemini-embedding-001"};
};

struct SparseConfig {
    bool enabled{true};
    std::int64_t bucket_count{30000};
    float k1{1.2f};
    float b{0.75f};
};

struct SearchConfig {
    search::DistanceMeasure distance_measure{search::DistanceMeasure::DOT_PRODUCT};
    std::size_t top_k{10};
    std::size_t backfill_parallelism{1};
};

struct BatchPaths {
    std::string batch_root;   /**< where embed output lands and backfill scans */
};

/** \brief Complete process configuration. */
struct AppConfig {
    FilterConfig filters;
    EmbeddingConfig embedding;
    SparseConfig sparse;
    SearchConfig search;
    BatchPaths batch_paths;

    /** \brief Field lists driving record projection. */
    [[nodiscard]] auto field_selection() const -> metadata::FieldSelection;

    /** \brief Encoder parameters for corpus and query mode. */
    [[nodiscard]] auto sparse_params() const -> index::SparseEncoderParams;
};

/** \brief Build a config from parsed JSON (no environment overrides). */
auto parse_config(const nlohmann::json& raw) -> std::expected<AppConfig, core::error>;

/** \brief Read, parse and apply environment overrides. */
auto load_config(const std::filesystem::path& path) -> std::expected<AppConfig, core::error>;

/** \brief load_config(VECLEX_CONFIG); config_invalid when the variable is unset. */
auto load_config() -> std::expected<AppConfig, core::error>;

/** \brief Apply VECLEX_* overrides in place. */
auto apply_env_overrides(AppConfig& cfg) -> void;

} // namespace veclex::config
