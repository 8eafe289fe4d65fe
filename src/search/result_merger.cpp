#include "veclex/search/result_merger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>

#include "veclex/core/platform_utils.hpp"
#include "veclex/index/datapoint.hpp"
#include "veclex/io/jsonl.hpp"
#include "veclex/kernels/normalize.hpp"

namespace veclex::search {

namespace {

auto input_error(std::string message) -> core::error {
    return core::error{core::error_code::invalid_argument, std::move(message), "search.query"};
}

auto lowercase(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

auto seconds_since(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// Metadata a stored record carries for backfill; nullopt when it has none.
auto record_metadata(nlohmann::json& record) -> std::optional<Metadata> {
    for (const char* key : {"embedding_metadata", "metadata"}) {
        auto it = record.find(key);
        if (it == record.end()) continue;
        std::optional<Metadata> m;
        m.emplace(std::move(*it));
        if (has_metadata(m)) return m;
    }
    return std::nullopt;
}

/** Shared state of one backfill scan across shard workers. */
struct ScanState {
    explicit ScanState(const std::unordered_set<std::string>& wanted) : ids(wanted) {}

    const std::unordered_set<std::string>& ids;
    std::mutex mu;
    MetadataLookup found;
    std::atomic<bool> done{false};
    std::atomic<std::size_t> blobs_scanned{0};
    std::atomic<std::size_t> lines_scanned{0};
    std::atomic<std::size_t> skipped_lines{0};
};

auto scan_blob(const io::BlobStore& store, const std::string& name, ScanState& st)
    -> std::expected<void, core::error> {
    if (st.done.load(std::memory_order_acquire)) return {};
    auto content = store.read(name);
    if (!content) return std::unexpected(content.error());
    st.blobs_scanned.fetch_add(1, std::memory_order_relaxed);

    const auto stats = io::for_each_object(*content, [&st](nlohmann::json&& record) {
        if (st.done.load(std::memory_order_acquire)) return false;
        auto id_it = record.find("id");
        if (id_it == record.end()) return true;
        auto id = index::id_to_string(*id_it);
        if (!id || !st.ids.contains(*id)) return true;
        auto meta = record_metadata(record);
        if (!meta) return true;

        std::lock_guard<std::mutex> lock(st.mu);
        st.found.try_emplace(std::move(*id), std::move(*meta));
        if (st.found.size() == st.ids.size()) {
            st.done.store(true, std::memory_order_release);
            return false;
        }
        return true;
    });
    st.lines_scanned.fetch_add(stats.lines, std::memory_order_relaxed);
    st.skipped_lines.fetch_add(stats.skipped, std::memory_order_relaxed);
    return {};
}

// Scans blobs shard, shard + stride, ... until done or exhausted.
auto scan_shard(const io::BlobStore& store, const std::vector<std::string>& names,
                std::size_t shard, std::size_t stride, ScanState& st)
    -> std::expected<void, core::error> {
    for (std::size_t i = shard; i < names.size(); i += stride) {
        if (st.done.load(std::memory_order_acquire)) break;
        if (!names[i].empty() && names[i].back() == '/') continue;
        auto r = scan_blob(store, names[i], st);
        if (!r) return r;
    }
    return {};
}

} // anonymous namespace

auto to_string(DistanceMeasure m) noexcept -> const char* {
    switch (m) {
        case DistanceMeasure::DOT_PRODUCT: return "DOT_PRODUCT_DISTANCE";
        case DistanceMeasure::COSINE: return "COSINE_DISTANCE";
        case DistanceMeasure::L2_NORM: return "SQUARED_L2_DISTANCE";
    }
    return "DOT_PRODUCT_DISTANCE";
}

auto parse_distance_measure(std::string_view name) -> std::optional<DistanceMeasure> {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    constexpr std::string_view suffix = "_DISTANCE";
    if (key.size() > suffix.size() && key.ends_with(suffix)) {
        key.resize(key.size() - suffix.size());
    }
    if (key == "DOT_PRODUCT") return DistanceMeasure::DOT_PRODUCT;
    if (key == "COSINE") return DistanceMeasure::COSINE;
    if (key == "L2_NORM" || key == "SQUARED_L2" || key == "L2") return DistanceMeasure::L2_NORM;
    return std::nullopt;
}

auto parse_search_request(const nlohmann::json& payload, std::size_t default_top_k)
    -> std::expected<SearchQuery, core::error> {
    if (!payload.is_object()) return std::unexpected(input_error("search payload must be an object"));

    std::string query_type = "vector";
    if (auto it = payload.find("query_type"); it != payload.end() && !it->is_null()) {
        if (!it->is_string()) return std::unexpected(input_error("query_type must be a string"));
        query_type = lowercase(it->get<std::string>());
    }

    SearchQuery q;
    q.top_k = default_top_k;
    const auto query_it = payload.find("query");
    if (query_type == "text") {
        if (query_it == payload.end() || !query_it->is_string()) {
            return std::unexpected(input_error("query must be a string when query_type is 'text'"));
        }
        q.text = query_it->get<std::string>();
    } else if (query_type == "vector") {
        if (query_it == payload.end() || !query_it->is_array()) {
            return std::unexpected(input_error("query must be a list of numbers when query_type is 'vector'"));
        }
        std::vector<float> v;
        v.reserve(query_it->size());
        for (const auto& x : *query_it) {
            if (!x.is_number()) {
                return std::unexpected(input_error("query must be a list of numbers when query_type is 'vector'"));
            }
            v.push_back(x.get<float>());
        }
        q.vector = std::move(v);
    } else {
        return std::unexpected(input_error("query_type must be 'text' or 'vector'"));
    }

    if (auto it = payload.find("top_k"); it != payload.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
            return std::unexpected(input_error("top_k must be a positive integer"));
        }
        q.top_k = static_cast<std::size_t>(it->get<std::int64_t>());
    }
    if (auto it = payload.find("use_bm25"); it != payload.end() && !it->is_null()) {
        if (!it->is_boolean()) return std::unexpected(input_error("use_bm25 must be a boolean"));
        q.hybrid = it->get<bool>();
    }
    if (auto it = payload.find("restricts"); it != payload.end()) {
        auto filters = index::parse_restrictions(*it);
        if (!filters) return std::unexpected(filters.error());
        q.filters = std::move(*filters);
    }
    for (const char* key : {"metadata_prefix", "metadata_gcs_prefix"}) {
        auto it = payload.find(key);
        if (it == payload.end() || it->is_null()) continue;
        if (!it->is_string()) return std::unexpected(input_error(std::string(key) + " must be a string"));
        if (!it->get_ref<const std::string&>().empty()) {
            q.metadata_prefix = it->get<std::string>();
            break;
        }
    }
    return q;
}

auto encode_search_query(const SearchQuery& query,
                         DenseEmbedder& embedder,
                         std::size_t dimension,
                         const index::SparseEncoder* sparse)
    -> std::expected<EncodedQuery, core::error> {
    using core::error; using core::error_code;
    if (query.text && query.vector) {
        return std::unexpected(input_error("query must be either text or a vector, not both"));
    }
    if (!query.text && !query.vector) {
        return std::unexpected(input_error("query needs text or a vector"));
    }
    if (query.hybrid && !query.text) {
        return std::unexpected(input_error("hybrid search requires a text query"));
    }
    if (query.hybrid && sparse == nullptr) {
        return std::unexpected(error{error_code::precondition_failed,
            "hybrid search requested but sparse encoding is disabled", "search.query"});
    }

    EncodedQuery out;
    if (query.text) {
        if (is_blank(*query.text)) return std::unexpected(input_error("text query must not be empty"));
        const auto start = std::chrono::steady_clock::now();
        auto rows = embedder.embed({*query.text}, EmbedTask::retrieval_query, dimension);
        if (!rows) return std::unexpected(rows.error());
        if (rows->size() != 1) {
            return std::unexpected(error{error_code::precondition_failed,
                "embedder returned " + std::to_string(rows->size()) + " vectors for one query",
                "search.embed"});
        }
        out.dense = std::move(rows->front());
        if (core::debug_enabled()) {
            std::cerr << "[search] embed runtime_sec=" << seconds_since(start) << "\n";
        }
        kernels::l2_normalize(out.dense);
    } else {
        if (query.vector->empty()) return std::unexpected(input_error("query vector must not be empty"));
        out.dense = *query.vector;
    }
    if (dimension != 0 && out.dense.size() != dimension) {
        return std::unexpected(error{error_code::precondition_failed,
            "query dimension " + std::to_string(out.dense.size()) + " != index dimension " +
            std::to_string(dimension), "search.query"});
    }

    if (query.hybrid) {
        auto vec = sparse->encode_query(*query.text);
        if (vec.has_signal()) out.sparse = std::move(vec);
    }
    return out;
}

auto missing_metadata_ids(const std::vector<NeighborResult>& results)
    -> std::unordered_set<std::string> {
    std::unordered_set<std::string> ids;
    for (const auto& r : results) {
        if (!r.id.empty() && !has_metadata(r.metadata)) ids.insert(r.id);
    }
    return ids;
}

auto apply_metadata(std::vector<NeighborResult>& results, const MetadataLookup& lookup) -> std::size_t {
    std::size_t applied = 0;
    for (auto& r : results) {
        if (has_metadata(r.metadata)) continue;
        auto it = lookup.find(r.id);
        if (it == lookup.end()) continue;
        r.metadata = it->second;
        ++applied;
    }
    return applied;
}

MetadataBackfill::MetadataBackfill(const io::BlobStore& store, std::string prefix, BackfillOptions options)
    : store_(store), prefix_(std::move(prefix)), options_(options) {}

auto MetadataBackfill::lookup(const std::unordered_set<std::string>& ids, BackfillStats* stats) const
    -> std::expected<MetadataLookup, core::error> {
    BackfillStats local;
    local.requested = ids.size();
    if (ids.empty()) {
        if (stats) *stats = local;
        return MetadataLookup{};
    }

    const auto start = std::chrono::steady_clock::now();
    auto names = store_.list(prefix_);
    if (!names) return std::unexpected(names.error());
    local.blobs_listed = names->size();

    ScanState st(ids);
    const std::size_t workers = std::clamp<std::size_t>(options_.parallelism, 1, std::max<std::size_t>(names->size(), 1));
    if (workers == 1) {
        auto r = scan_shard(store_, *names, 0, 1, st);
        if (!r) return std::unexpected(r.error());
    } else {
        std::vector<std::future<std::expected<void, core::error>>> futures;
        futures.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            futures.push_back(std::async(std::launch::async, [this, &names, &st, w, workers]() {
                return scan_shard(store_, *names, w, workers, st);
            }));
        }
        // Join every worker before reporting so none outlives the scan state.
        std::optional<core::error> first_error;
        for (auto& f : futures) {
            auto r = f.get();
            if (!r && !first_error) first_error = r.error();
        }
        if (first_error) return std::unexpected(*first_error);
    }

    local.found = st.found.size();
    local.blobs_scanned = st.blobs_scanned.load();
    local.lines_scanned = st.lines_scanned.load();
    local.skipped_lines = st.skipped_lines.load();
    local.complete = st.done.load();
    if (core::debug_enabled()) {
        std::cerr << "[search] metadata scan prefix=" << prefix_
                  << " requested=" << local.requested << " found=" << local.found
                  << " blobs=" << local.blobs_scanned << "/" << local.blobs_listed
                  << " skipped_lines=" << local.skipped_lines
                  << " runtime_sec=" << seconds_since(start) << "\n";
    }
    if (stats) *stats = local;
    return std::move(st.found);
}

auto MetadataBackfill::apply(std::vector<NeighborResult>& results) const
    -> std::expected<BackfillStats, core::error> {
    BackfillStats stats;
    const auto ids = missing_metadata_ids(results);
    if (ids.empty()) return stats;
    auto found = lookup(ids, &stats);
    if (!found) return std::unexpected(found.error());
    stats.applied = apply_metadata(results, *found);
    return stats;
}

} // namespace veclex::search
