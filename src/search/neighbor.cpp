#include "veclex/search/neighbor.hpp"

#include "veclex/index/datapoint.hpp"

namespace veclex::search {

namespace {

auto normalize_error(std::string message) -> core::error {
    return core::error{core::error_code::invalid_argument, std::move(message), "search.normalize"};
}

auto member(const nlohmann::json& obj, const char* key) -> const nlohmann::json* {
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &*it;
}

// First of the given members that carries metadata.
auto pick_metadata(const nlohmann::json& obj, std::initializer_list<const char*> keys)
    -> std::optional<Metadata> {
    for (const char* key : keys) {
        if (const auto* v = member(obj, key); v && !v->is_null()) {
            std::optional<Metadata> m;
            m.emplace(*v);
            if (has_metadata(m)) return m;
        }
    }
    return std::nullopt;
}

auto pick_id(const nlohmann::json& obj, std::initializer_list<const char*> keys)
    -> std::optional<std::string> {
    for (const char* key : keys) {
        if (const auto* v = member(obj, key)) {
            if (auto id = index::id_to_string(*v)) return id;
        }
    }
    return std::nullopt;
}

auto read_number(const nlohmann::json& obj, const char* key)
    -> std::expected<std::optional<double>, core::error> {
    const auto* v = member(obj, key);
    if (v == nullptr || v->is_null()) return std::optional<double>{};
    if (!v->is_number()) {
        return std::unexpected(normalize_error(std::string("neighbor ") + key + " must be numeric"));
    }
    return std::optional<double>{v->get<double>()};
}

} // anonymous namespace

auto has_metadata(const std::optional<Metadata>& metadata) noexcept -> bool {
    if (!metadata || metadata->is_null()) return false;
    return !(metadata->is_object() && metadata->empty());
}

auto decode_neighbor(const nlohmann::json& raw) -> std::expected<NeighborShape, core::error> {
    if (!raw.is_object()) {
        return std::unexpected(normalize_error("neighbor must be an object"));
    }
    auto distance = read_number(raw, "distance");
    if (!distance) return std::unexpected(distance.error());
    auto score = read_number(raw, "score");
    if (!score) return std::unexpected(score.error());

    const auto* dp = member(raw, "datapoint");
    if (dp != nullptr && !dp->is_null()) {
        if (!dp->is_object()) {
            return std::unexpected(normalize_error("neighbor datapoint must be an object"));
        }
        NestedNeighbor n;
        auto id = pick_id(*dp, {"datapoint_id", "id"});
        if (!id) id = pick_id(raw, {"id"});
        if (!id) return std::unexpected(normalize_error("neighbor has no datapoint id"));
        n.datapoint_id = std::move(*id);
        n.metadata = pick_metadata(*dp, {"embedding_metadata", "metadata"});
        if (!n.metadata) n.metadata = pick_metadata(raw, {"metadata", "embedding_metadata"});
        n.distance = *distance;
        n.score = *score;
        return NeighborShape{std::move(n)};
    }

    FlatNeighbor f;
    auto id = pick_id(raw, {"id", "datapoint_id"});
    if (!id) return std::unexpected(normalize_error("neighbor has no id"));
    f.id = std::move(*id);
    f.metadata = pick_metadata(raw, {"metadata", "embedding_metadata"});
    f.distance = *distance;
    f.score = *score;
    return NeighborShape{std::move(f)};
}

auto normalize_neighbor(const NeighborShape& shape) -> NeighborResult {
    NeighborResult r;
    if (const auto* n = std::get_if<NestedNeighbor>(&shape)) {
        r.id = n->datapoint_id;
        r.score = n->distance ? n->distance : n->score;
        r.metadata = n->metadata;
    } else {
        const auto& f = std::get<FlatNeighbor>(shape);
        r.id = f.id;
        r.score = f.distance ? f.distance : f.score;
        r.metadata = f.metadata;
    }
    return r;
}

auto normalize_neighbors(const std::vector<nlohmann::json>& raw)
    -> std::expected<std::vector<NeighborResult>, core::error> {
    std::vector<NeighborResult> out;
    out.reserve(raw.size());
    for (const auto& item : raw) {
        auto shape = decode_neighbor(item);
        if (!shape) return std::unexpected(shape.error());
        out.push_back(normalize_neighbor(*shape));
    }
    return out;
}

auto to_json(const NeighborResult& result) -> nlohmann::json {
    nlohmann::json out = nlohmann::json::object();
    out["id"] = result.id;
    out["score"] = result.score ? nlohmann::json(*result.score) : nlohmann::json(nullptr);
    out["metadata"] = result.metadata ? *result.metadata : nlohmann::json(nullptr);
    return out;
}

} // namespace veclex::search
