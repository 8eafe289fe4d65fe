#include "veclex/config/app_config.hpp"

#include <fstream>
#include <iostream>
#include <limits>

#include "veclex/core/platform_utils.hpp"

namespace veclex::config {

namespace {

auto invalid(const std::string& key, const char* what) -> core::error {
    return core::error{core::error_code::config_invalid, key + " " + what, "config"};
}

auto section(const nlohmann::json& j, const char* key)
    -> std::expected<const nlohmann::json*, core::error> {
    if (!j.contains(key) || j[key].is_null()) return nullptr;
    if (!j[key].is_object()) return std::unexpected(invalid(key, "must be an object"));
    return &j[key];
}

auto read_list(const nlohmann::json& s, const char* key, std::vector<std::string>& out)
    -> std::expected<void, core::error> {
    if (!s.contains(key) || s[key].is_null()) return {};
    if (!s[key].is_array()) return std::unexpected(invalid(key, "must be a list of strings"));
    std::vector<std::string> values;
    for (const auto& v : s[key]) {
        if (!v.is_string()) return std::unexpected(invalid(key, "must be a list of strings"));
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return {};
}

auto read_string(const nlohmann::json& s, const char* key, std::string& out)
    -> std::expected<void, core::error> {
    if (!s.contains(key) || s[key].is_null()) return {};
    if (!s[key].is_string()) return std::unexpected(invalid(key, "must be a string"));
    out = s[key].get<std::string>();
    return {};
}

auto read_size(const nlohmann::json& s, const char* key, std::size_t& out)
    -> std::expected<void, core::error> {
    if (!s.contains(key) || s[key].is_null()) return {};
    if (!s[key].is_number_integer() || s[key].get<std::int64_t>() <= 0) {
        return std::unexpected(invalid(key, "must be a positive integer"));
    }
    out = s[key].get<std::size_t>();
    return {};
}

auto read_float(const nlohmann::json& s, const char* key, float& out)
    -> std::expected<void, core::error> {
    if (!s.contains(key) || s[key].is_null()) return {};
    if (!s[key].is_number()) return std::unexpected(invalid(key, "must be a number"));
    out = s[key].get<float>();
    return {};
}

} // anonymous namespace

auto AppConfig::field_selection() const -> metadata::FieldSelection {
    metadata::FieldSelection sel;
    sel.text_fields = embedding.text_fields;
    sel.metadata_fields = embedding.metadata_fields;
    sel.restrict_fields = filters.restricts_fields;
    sel.numeric_restrict_fields = filters.numeric_restricts_fields;
    sel.timestamp_fields = filters.timestamp_fields;
    return sel;
}

auto AppConfig::sparse_params() const -> index::SparseEncoderParams {
    index::SparseEncoderParams p;
    p.bucket_count = sparse.bucket_count;
    p.bm25.k1 = sparse.k1;
    p.bm25.b = sparse.b;
    return p;
}

auto parse_config(const nlohmann::json& raw) -> std::expected<AppConfig, core::error> {
    AppConfig cfg;
    if (raw.is_null()) return cfg;
    if (!raw.is_object()) {
        return std::unexpected(core::error{core::error_code::config_invalid,
            "config root must be an object", "config"});
    }

    // Each reader leaves the default in place when its key is absent.
    std::expected<void, core::error> r;
#define VECLEX_CONFIG_TRY(expr) do { r = (expr); if (!r) return std::unexpected(r.error()); } while (0)

    auto filters_section = section(raw, "filters");
    if (!filters_section) return std::unexpected(filters_section.error());
    if (const auto* f = *filters_section) {
        VECLEX_CONFIG_TRY(read_list(*f, "restricts_fields", cfg.filters.restricts_fields));
        VECLEX_CONFIG_TRY(read_list(*f, "numeric_restricts_fields", cfg.filters.numeric_restricts_fields));
        VECLEX_CONFIG_TRY(read_list(*f, "timestamp_fields", cfg.filters.timestamp_fields));
    }

    auto embedding_section = section(raw, "embedding");
    if (!embedding_section) return std::unexpected(embedding_section.error());
    if (const auto* e = *embedding_section) {
        VECLEX_CONFIG_TRY(read_list(*e, "text_fields", cfg.embedding.text_fields));
        VECLEX_CONFIG_TRY(read_list(*e, "metadata_fields", cfg.embedding.metadata_fields));
        VECLEX_CONFIG_TRY(read_size(*e, "output_dimensionality", cfg.embedding.output_dimensionality));
        VECLEX_CONFIG_TRY(read_string(*e, "model_name", cfg.embedding.model_name));
    }

    auto sparse_section = section(raw, "sparse");
    if (!sparse_section) return std::unexpected(sparse_section.error());
    if (const auto* s = *sparse_section) {
        if (s->contains("enabled") && !(*s)["enabled"].is_null()) {
            if (!(*s)["enabled"].is_boolean()) return std::unexpected(invalid("enabled", "must be a boolean"));
            cfg.sparse.enabled = (*s)["enabled"].get<bool>();
        }
        if (s->contains("bucket_count") && !(*s)["bucket_count"].is_null()) {
            const auto& v = (*s)["bucket_count"];
            if (!v.is_number_integer() || v.get<std::int64_t>() <= 0 ||
                v.get<std::int64_t>() > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
                return std::unexpected(invalid("bucket_count", "must be a positive 32-bit integer"));
            }
            cfg.sparse.bucket_count = v.get<std::int64_t>();
        }
        VECLEX_CONFIG_TRY(read_float(*s, "k1", cfg.sparse.k1));
        VECLEX_CONFIG_TRY(read_float(*s, "b", cfg.sparse.b));
        if (!(cfg.sparse.k1 > 0.0f)) return std::unexpected(invalid("k1", "must be positive"));
        if (!(cfg.sparse.b >= 0.0f && cfg.sparse.b <= 1.0f)) return std::unexpected(invalid("b", "must be in [0, 1]"));
    }

    auto search_section = section(raw, "search");
    if (!search_section) return std::unexpected(search_section.error());
    if (const auto* s = *search_section) {
        std::string measure;
        VECLEX_CONFIG_TRY(read_string(*s, "distance_measure", measure));
        if (!measure.empty()) {
            auto m = search::parse_distance_measure(measure);
            if (!m) return std::unexpected(invalid("distance_measure", "must be DOT_PRODUCT, COSINE or L2_NORM"));
            cfg.search.distance_measure = *m;
        }
        VECLEX_CONFIG_TRY(read_size(*s, "top_k", cfg.search.top_k));
        VECLEX_CONFIG_TRY(read_size(*s, "backfill_parallelism", cfg.search.backfill_parallelism));
    }

    auto paths_section = section(raw, "batch_paths");
    if (!paths_section) return std::unexpected(paths_section.error());
    if (const auto* p = *paths_section) {
        VECLEX_CONFIG_TRY(read_string(*p, "batch_root", cfg.batch_paths.batch_root));
    }
#undef VECLEX_CONFIG_TRY
    return cfg;
}

auto apply_env_overrides(AppConfig& cfg) -> void {
    if (auto v = core::safe_getenv("VECLEX_BATCH_ROOT"); v && !v->empty()) {
        cfg.batch_paths.batch_root = *v;
    }
}

auto load_config(const std::filesystem::path& path) -> std::expected<AppConfig, core::error> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(core::error{core::error_code::config_invalid,
            "cannot open config " + path.string(), "config"});
    }
    auto raw = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (raw.is_discarded()) {
        return std::unexpected(core::error{core::error_code::config_invalid,
            "config is not valid JSON: " + path.string(), "config"});
    }
    auto cfg = parse_config(raw);
    if (!cfg) return cfg;
    apply_env_overrides(*cfg);
    if (core::debug_enabled()) {
        std::cerr << "[config] loaded " << path.string()
                  << " model=" << cfg->embedding.model_name
                  << " dimension=" << cfg->embedding.output_dimensionality
                  << " sparse=" << (cfg->sparse.enabled ? "on" : "off")
                  << " batch_root=" << cfg->batch_paths.batch_root << "\n";
    }
    return cfg;
}

auto load_config() -> std::expected<AppConfig, core::error> {
    auto path = core::safe_getenv("VECLEX_CONFIG");
    if (!path || path->empty()) {
        return std::unexpected(core::error{core::error_code::config_invalid,
            "VECLEX_CONFIG is not set", "config"});
    }
    return load_config(std::filesystem::path(*path));
}

} // namespace veclex::config
