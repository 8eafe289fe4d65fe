#pragma once

/** \file jsonl.hpp
 *  \brief Line-delimited JSON reading and writing.
 *
 * Readers are tolerant: blank lines are ignored, and lines that are not valid
 * JSON objects are skipped and counted rather than failing the whole stream.
 * Callers that need strictness check LineStats::skipped themselves.
 */

#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace veclex::io {

/** \brief Counters of one read pass. */
struct LineStats {
    std::size_t lines{0};     /**< non-blank lines seen */
    std::size_t objects{0};   /**< lines delivered to the visitor */
    std::size_t skipped{0};   /**< malformed or non-object lines */
    bool stopped{false};      /**< visitor asked to stop before the end */
};

/** \brief Visitor for parsed objects; return false to stop reading. */
using ObjectVisitor = std::function<bool(nlohmann::json&&)>;

/** \brief Visit every JSON object line of a stream. */
auto for_each_object(std::istream& in, const ObjectVisitor& visit) -> LineStats;

/** \brief Visit every JSON object line of an in-memory buffer. */
auto for_each_object(std::string_view content, const ObjectVisitor& visit) -> LineStats;

/** \brief Collect every JSON object line of a buffer. */
auto read_objects(std::string_view content, LineStats* stats = nullptr) -> std::vector<nlohmann::json>;

/** \brief Join values as compact JSON, one per line, with a trailing newline. */
auto write_lines(const std::vector<nlohmann::json>& items) -> std::string;

} // namespace veclex::io
