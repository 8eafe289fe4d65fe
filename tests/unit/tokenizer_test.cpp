/** \file tokenizer_test.cpp
 *  \brief Unit tests for ASCII term extraction.
 */

#include <catch2/catch_test_macros.hpp>

#include "veclex/text/tokenizer.hpp"

#include <string>
#include <vector>

using namespace veclex::text;

TEST_CASE("Tokenizer lowercases and splits on non-alphanumerics", "[tokenizer]") {
    SECTION("Punctuation and digits") {
        auto tokens = Tokenizer::tokenize("Data Science! 2024.");
        REQUIRE(tokens == std::vector<std::string>{"data", "science", "2024"});
    }

    SECTION("Empty and separator-only input") {
        REQUIRE(Tokenizer::tokenize("").empty());
        REQUIRE(Tokenizer::tokenize("  ,.;!?  \n\t").empty());
    }

    SECTION("Mixed alphanumeric runs stay whole") {
        auto tokens = Tokenizer::tokenize("GPT4o vs. v2-beta");
        REQUIRE(tokens == std::vector<std::string>{"gpt4o", "vs", "v2", "beta"});
    }

    SECTION("Non-ASCII bytes are separators") {
        auto tokens = Tokenizer::tokenize("caf\xC3\xA9 na\xC3\xAFve");
        REQUIRE(tokens == std::vector<std::string>{"caf", "na", "ve"});
    }

    SECTION("Underscore and apostrophe separate terms") {
        auto tokens = Tokenizer::tokenize("snake_case don't");
        REQUIRE(tokens == std::vector<std::string>{"snake", "case", "don", "t"});
    }
}

TEST_CASE("Tokenizer is deterministic", "[tokenizer]") {
    const std::string text = "The quick brown fox, the LAZY dog.";
    REQUIRE(Tokenizer::tokenize(text) == Tokenizer::tokenize(text));
    REQUIRE(Tokenizer::tokenize(text).size() == 7);
}

TEST_CASE("Tokenizer term characters", "[tokenizer]") {
    REQUIRE(Tokenizer::is_term_char('a'));
    REQUIRE(Tokenizer::is_term_char('Z'));
    REQUIRE(Tokenizer::is_term_char('7'));
    REQUIRE_FALSE(Tokenizer::is_term_char('_'));
    REQUIRE_FALSE(Tokenizer::is_term_char(' '));
    REQUIRE_FALSE(Tokenizer::is_term_char(static_cast<char>(0xC3)));
}
