#pragma once

/** \file datapoint.hpp
 *  \brief Index entries: assembly, line-delimited JSON form and parsing.
 *
 * An IndexEntry is the unit upserted into the vector-search service and
 * persisted as one JSON object per line:
 *
 *   {"id": "...", "embedding": [...],
 *    "sparse_embedding": {"dimensions": [...], "values": [...]},
 *    "restricts": [{"namespace": "...", "allow": [...], "deny": [...]}],
 *    "numeric_restricts": [{"namespace": "...", "value_int"|"value_float": n}],
 *    "embedding_metadata": {...}, "crowding_tag": "..."}
 *
 * Optional members are omitted when empty. Parsing accepts entries written by
 * older producers that lack any optional member.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "veclex/error.hpp"
#include "veclex/index/restriction.hpp"
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/record.hpp"

namespace veclex::index {

/** \brief Canonical index entry. */
struct IndexEntry {
    std::string id;                                  /**< non-empty, unique within a batch */
    std::vector<float> dense_vector;                 /**< fixed dimension D */
    std::optional<TermBucketVector> sparse_vector;   /**< absent when there is no lexical signal */
    std::vector<Restriction> restricts;
    std::vector<NumericRestriction> numeric_restricts;
    Metadata metadata = Metadata::object();
    std::optional<std::string> crowding_tag;

    auto operator==(const IndexEntry&) const -> bool = default;
};

/** \brief Build an entry from its parts.
 *
 * \param id Entry identifier; strings are used as-is, numbers are coerced to text
 * \param dense_vector Dense embedding, non-empty
 * \param sparse_vector Attached only if it carries at least one non-zero weight
 * \return Entry, or invalid_argument for an empty id, empty dense vector or a
 *         malformed sparse vector
 */
auto assemble(const nlohmann::json& id,
              std::vector<float> dense_vector,
              std::optional<TermBucketVector> sparse_vector,
              std::vector<Restriction> restricts,
              std::vector<NumericRestriction> numeric_restricts,
              Metadata metadata)
    -> std::expected<IndexEntry, core::error>;

/** \brief Serialize an entry to its JSON object form. */
auto to_json(const IndexEntry& entry) -> nlohmann::json;

/** \brief Serialize an entry to one line of text (no trailing newline). */
auto to_line(const IndexEntry& entry) -> std::string;

/** \brief Parse an entry; optional members default to empty/absent.
 *
 * \return Entry, or data_integrity when "id" or "embedding" is missing or
 *         a member has the wrong type
 */
auto parse(const nlohmann::json& item) -> std::expected<IndexEntry, core::error>;

/** \brief Parse one line of text. */
auto parse_line(std::string_view line) -> std::expected<IndexEntry, core::error>;

/** \brief Coerce an identifier value to text; nullopt for null, empty or non-scalar ids. */
auto id_to_string(const nlohmann::json& id) -> std::optional<std::string>;

/** \brief Build query-time namespace filters from a caller payload.
 *
 * Accepts "namespace"|"name", "allow"|"allow_list"|"allow_tokens" and
 * "deny"|"deny_list"|"deny_tokens". Entries without a namespace are skipped.
 *
 * \return Filters, or invalid_argument if the payload is not an array of objects
 */
auto parse_restrictions(const nlohmann::json& payload)
    -> std::expected<std::vector<Restriction>, core::error>;

/** \brief JSON form of a restriction list ("deny" omitted when empty). */
auto restrictions_to_json(const std::vector<Restriction>& restricts) -> nlohmann::json;

/** \brief JSON form of a sparse vector. */
auto sparse_to_json(const TermBucketVector& vec) -> nlohmann::json;

} // namespace veclex::index
