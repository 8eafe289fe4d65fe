#pragma once

/** \file record_projector.hpp
 *  \brief Field-driven extraction of text, metadata and filters from records.
 *
 * Every extraction is driven by configured field lists, never by the shape of
 * the record. All functions are pure: the same record and selection always
 * produce the same output.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "veclex/index/restriction.hpp"
#include "veclex/record.hpp"

namespace veclex::metadata {

/** \brief Named field lists selecting what each extraction reads. */
struct FieldSelection {
    std::vector<std::string> text_fields;             /**< concatenated into the embedding text */
    std::vector<std::string> metadata_fields;         /**< copied into display metadata */
    std::vector<std::string> restrict_fields;         /**< categorical restricts */
    std::vector<std::string> numeric_restrict_fields; /**< numeric restricts */
    std::vector<std::string> timestamp_fields{"created_at", "updated_at"}; /**< parsed as timestamps */
};

/** \brief Everything projected from one record. */
struct Projection {
    std::string text;
    Metadata metadata = Metadata::object();
    std::vector<index::Restriction> restricts;
    std::vector<index::NumericRestriction> numeric_restricts;
    std::size_t skipped_values{0};  /**< numeric values dropped as unparseable */
};

/** \brief Join the string form of configured, non-empty fields with '\n'. */
auto build_text(const Record& record, const std::vector<std::string>& text_fields) -> std::string;

/** \brief Copy configured fields present in the record; absent fields are omitted. */
auto build_metadata(const Record& record, const std::vector<std::string>& metadata_fields) -> Metadata;

/** \brief One allow-list restriction per configured field with a non-empty value. */
auto build_restricts(const Record& record, const std::vector<std::string>& restrict_fields)
    -> std::vector<index::Restriction>;

/** \brief Numeric restrictions, parsing timestamp fields to epoch seconds.
 *
 * \param record Source record
 * \param numeric_fields Fields to read
 * \param timestamp_fields Fields resolved through parse_timestamp
 * \param skipped Incremented once per value dropped as unparseable (may be null)
 */
auto build_numeric_restricts(const Record& record,
                             const std::vector<std::string>& numeric_fields,
                             const std::vector<std::string>& timestamp_fields,
                             std::size_t* skipped = nullptr)
    -> std::vector<index::NumericRestriction>;

/** \brief Run all four extractions. */
auto project(const Record& record, const FieldSelection& selection) -> Projection;

/** \brief Parse a timestamp into epoch seconds.
 *
 * Numbers are taken as epoch seconds (truncated toward zero). Text is matched
 * against "DD/MM/YYYY HH:MM", "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DDTHH:MM:SS"
 * in that order and interpreted as UTC.
 *
 * \return Epoch seconds, or nullopt when unparseable (never throws)
 */
auto parse_timestamp(const nlohmann::json& value) -> std::optional<std::int64_t>;

/** \brief Text form used for text and restrict values: strings verbatim, booleans as True/False, other values as JSON. */
auto stringify(const nlohmann::json& value) -> std::string;

/** \brief True for null and the empty string. */
auto is_empty_value(const nlohmann::json& value) noexcept -> bool;

/** \brief Trim ASCII whitespace; empty text becomes a single space. */
auto as_nonempty_text(std::string_view text) -> std::string;

} // namespace veclex::metadata
