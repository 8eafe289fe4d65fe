#pragma once

/** \file tokenizer.hpp
 *  \brief Lexical tokenizer shared by corpus and query sparse encoding.
 *
 * Terms are maximal runs of ASCII letters and digits, lowercased. Every other
 * byte (punctuation, whitespace, UTF-8 continuation bytes) separates terms and
 * is dropped. There is no stopword list and no length filter: the term space
 * must be identical on the document and the query side.
 *
 * Thread-safety: stateless; safe for concurrent calls.
 */

#include <string>
#include <string_view>
#include <vector>

namespace veclex::text {

class Tokenizer {
public:
    /** \brief Split text into lowercase alphanumeric terms.
     *
     * \param text Input text (any encoding; only ASCII alphanumerics form terms)
     * \return Terms in order of appearance; empty for empty input
     */
    static auto tokenize(std::string_view text) -> std::vector<std::string>;

    /** \brief True if the byte belongs to a term. */
    static auto is_term_char(char c) noexcept -> bool;
};

} // namespace veclex::text
