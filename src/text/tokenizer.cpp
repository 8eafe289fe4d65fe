#include "veclex/text/tokenizer.hpp"

namespace veclex::text {

auto Tokenizer::is_term_char(char c) noexcept -> bool {
    // std::isalnum is locale dependent; terms are ASCII only.
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

auto Tokenizer::tokenize(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current_token;

    for (char c : text) {
        if (is_term_char(c)) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
            current_token.push_back(c);
        } else if (!current_token.empty()) {
            tokens.push_back(std::move(current_token));
            current_token.clear();
        }
    }

    // Handle last token
    if (!current_token.empty()) {
        tokens.push_back(std::move(current_token));
    }

    return tokens;
}

} // namespace veclex::text
