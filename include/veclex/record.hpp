#pragma once

/** \file record.hpp
 *  \brief Loosely typed record and metadata values.
 *
 * Records come from tabular sources and metadata travels to and from the
 * vector-search service untouched, so both are kept as JSON values rather
 * than mapped onto fixed structs.
 */

#include <nlohmann/json.hpp>

namespace veclex {

/** \brief One tabular row: field name -> scalar or array value (a JSON object). */
using Record = nlohmann::json;

/** \brief Display metadata attached to an index entry (a JSON object). */
using Metadata = nlohmann::json;

} // namespace veclex
