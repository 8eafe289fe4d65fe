#pragma once

/** \file restriction.hpp
 *  \brief Categorical and numeric filter clauses attached to index entries.
 *
 * Restrictions are evaluated by the vector-search service at query time; this
 * library only builds, serializes and parses them.
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace veclex::index {

/** \brief Categorical allow/deny clause within one namespace. */
struct Restriction {
    std::string namespace_;          /**< attribute name, non-empty */
    std::vector<std::string> allow;  /**< allowed tokens */
    std::vector<std::string> deny;   /**< denied tokens */

    auto operator==(const Restriction&) const -> bool = default;
};

/** \brief Numeric attribute value: exactly one of integer or floating. */
using NumericValue = std::variant<std::int64_t, double>;

/** \brief Numeric attribute attached to an index entry. */
struct NumericRestriction {
    std::string namespace_;  /**< attribute name, non-empty */
    NumericValue value{std::int64_t{0}};

    auto is_float() const noexcept -> bool { return std::holds_alternative<double>(value); }

    auto operator==(const NumericRestriction&) const -> bool = default;
};

} // namespace veclex::index
