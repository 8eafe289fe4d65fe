/** \file app_config_test.cpp
 *  \brief Unit tests for configuration parsing and loading.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "veclex/config/app_config.hpp"

#include <tests/support/fakes.hpp>

#include <cstdlib>
#include <fstream>

using namespace veclex;
using namespace veclex::config;
using nlohmann::json;
using Catch::Matchers::WithinRel;

namespace {

void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

} // namespace

TEST_CASE("Missing keys take defaults", "[config]") {
    auto cfg = parse_config(json::object());
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->filters.timestamp_fields == std::vector<std::string>{"created_at", "updated_at"});
    REQUIRE(cfg->embedding.output_dimensionality == 768);
    REQUIRE(cfg->embedding.model_name == "gemini-embedding-001");
    REQUIRE(cfg->sparse.enabled);
    REQUIRE(cfg->sparse.bucket_count == 30000);
    REQUIRE(cfg->search.distance_measure == search::DistanceMeasure::DOT_PRODUCT);
    REQUIRE(cfg->search.top_k == 10);
    REQUIRE(cfg->batch_paths.batch_root.empty());

    REQUIRE(parse_config(json(nullptr)).has_value());
}

TEST_CASE("Full config is mapped", "[config]") {
    json raw{
        {"filters", {
            {"restricts_fields", {"color", "tags"}},
            {"numeric_restricts_fields", {"price"}},
            {"timestamp_fields", {"published"}},
        }},
        {"embedding", {
            {"text_fields", {"title", "body"}},
            {"metadata_fields", {"title"}},
            {"output_dimensionality", 256},
            {"model_name", "text-embedding-005"},
        }},
        {"sparse", {{"enabled", false}, {"bucket_count", 4096}, {"k1", 1.5}, {"b", 0.5}}},
        {"search", {{"distance_measure", "COSINE_DISTANCE"}, {"top_k", 25}, {"backfill_parallelism", 4}}},
        {"batch_paths", {{"batch_root", "gs://bucket/batch"}}},
    };
    auto cfg = parse_config(raw);
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->embedding.output_dimensionality == 256);
    REQUIRE(cfg->search.distance_measure == search::DistanceMeasure::COSINE);
    REQUIRE(cfg->search.backfill_parallelism == 4);
    REQUIRE(cfg->embedding.model_name == "text-embedding-005");
    REQUIRE(cfg->batch_paths.batch_root == "gs://bucket/batch");

    auto sel = cfg->field_selection();
    REQUIRE(sel.text_fields == std::vector<std::string>{"title", "body"});
    REQUIRE(sel.restrict_fields == std::vector<std::string>{"color", "tags"});
    REQUIRE(sel.numeric_restrict_fields == std::vector<std::string>{"price"});
    REQUIRE(sel.timestamp_fields == std::vector<std::string>{"published"});

    auto params = cfg->sparse_params();
    REQUIRE(params.bucket_count == 4096);
    REQUIRE_THAT(params.bm25.k1, WithinRel(1.5f, 1e-6f));
    REQUIRE_THAT(params.bm25.b, WithinRel(0.5f, 1e-6f));
    REQUIRE_FALSE(cfg->sparse.enabled);
}

TEST_CASE("Wrong types and ranges are config_invalid", "[config]") {
    for (const json& bad : {
             json::array(),
             json{{"filters", "color"}},
             json{{"filters", {{"restricts_fields", "color"}}}},
             json{{"filters", {{"restricts_fields", {"color", 3}}}}},
             json{{"embedding", {{"output_dimensionality", 0}}}},
             json{{"embedding", {{"output_dimensionality", "768"}}}},
             json{{"embedding", {{"model_name", 7}}}},
             json{{"sparse", {{"enabled", "yes"}}}},
             json{{"sparse", {{"bucket_count", 0}}}},
             json{{"sparse", {{"bucket_count", 5000000000LL}}}},
             json{{"sparse", {{"k1", 0}}}},
             json{{"sparse", {{"b", 1.5}}}},
             json{{"search", {{"distance_measure", "MANHATTAN"}}}},
             json{{"search", {{"top_k", -1}}}},
             json{{"batch_paths", {{"batch_root", 1}}}},
         }) {
        auto cfg = parse_config(bad);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().code == core::error_code::config_invalid);
        REQUIRE(cfg.error().component == "config");
    }
}

TEST_CASE("load_config reads files and applies overrides", "[config]") {
    test_support::TempDir dir("veclex_config_test");
    const auto path = dir.path() / "config.json";

    SECTION("File values with the batch root override") {
        write_file(path, R"({"embedding": {"output_dimensionality": 3}, "batch_paths": {"batch_root": "gs://b/from-file"}})");
        unsetenv("VECLEX_BATCH_ROOT");
        auto cfg = load_config(path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->embedding.output_dimensionality == 3);
        REQUIRE(cfg->batch_paths.batch_root == "gs://b/from-file");

        setenv("VECLEX_BATCH_ROOT", "gs://b/from-env", 1);
        auto overridden = load_config(path);
        unsetenv("VECLEX_BATCH_ROOT");
        REQUIRE(overridden.has_value());
        REQUIRE(overridden->batch_paths.batch_root == "gs://b/from-env");
    }

    SECTION("Unreadable or malformed files fail") {
        REQUIRE(load_config(dir.path() / "absent.json").error().code == core::error_code::config_invalid);
        write_file(path, "{not json");
        REQUIRE(load_config(path).error().code == core::error_code::config_invalid);
    }

    SECTION("VECLEX_CONFIG selects the file") {
        write_file(path, R"({"search": {"top_k": 3}})");
        unsetenv("VECLEX_CONFIG");
        REQUIRE(load_config().error().code == core::error_code::config_invalid);
        setenv("VECLEX_CONFIG", path.string().c_str(), 1);
        auto cfg = load_config();
        unsetenv("VECLEX_CONFIG");
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->search.top_k == 3);
    }
}
