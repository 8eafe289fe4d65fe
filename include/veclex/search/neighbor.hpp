#pragma once

/** \file neighbor.hpp
 *  \brief Decoding of raw neighbor objects into canonical results.
 *
 * The vector-search service answers in one of two shapes:
 *
 *   nested: {"distance": 0.5, "datapoint": {"datapoint_id": "x", "embedding_metadata": {...}}}
 *   flat:   {"id": "x", "score": 0.5, "metadata": {...}}
 *
 * Decoding is exhaustive: anything that is neither shape is rejected rather
 * than defaulted. Scores are passed through untouched; their ordering
 * convention belongs to the configured distance measure.
 */

#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "veclex/error.hpp"
#include "veclex/record.hpp"

namespace veclex::search {

/** \brief Neighbor whose id and metadata live under a "datapoint" object. */
struct NestedNeighbor {
    std::string datapoint_id;
    std::optional<Metadata> metadata;
    std::optional<double> distance;
    std::optional<double> score;
};

/** \brief Neighbor with top-level id and metadata. */
struct FlatNeighbor {
    std::string id;
    std::optional<Metadata> metadata;
    std::optional<double> distance;
    std::optional<double> score;
};

using NeighborShape = std::variant<NestedNeighbor, FlatNeighbor>;

/** \brief Canonical neighbor: {id, score, metadata}. */
struct NeighborResult {
    std::string id;
    std::optional<double> score;       /**< distance, else score, else null */
    std::optional<Metadata> metadata;  /**< null until known */

    auto operator==(const NeighborResult&) const -> bool = default;
};

/** \brief Decode one raw neighbor.
 *
 * \return Shape, or invalid_argument (component "search.normalize") for a
 *         non-object, a non-object "datapoint", a missing id or a non-numeric score
 */
auto decode_neighbor(const nlohmann::json& raw) -> std::expected<NeighborShape, core::error>;

/** \brief Collapse a decoded shape; "distance" wins over "score". */
auto normalize_neighbor(const NeighborShape& shape) -> NeighborResult;

/** \brief Decode and normalize a whole neighbor list, preserving order. */
auto normalize_neighbors(const std::vector<nlohmann::json>& raw)
    -> std::expected<std::vector<NeighborResult>, core::error>;

/** \brief True when metadata is present and not an empty object. */
auto has_metadata(const std::optional<Metadata>& metadata) noexcept -> bool;

/** \brief {"id", "score", "metadata"} with nulls for absent values. */
auto to_json(const NeighborResult& result) -> nlohmann::json;

} // namespace veclex::search
