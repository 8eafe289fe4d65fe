/** \file record_projector_test.cpp
 *  \brief Unit tests for text, metadata and restrict extraction.
 */

#include <catch2/catch_test_macros.hpp>

#include "veclex/metadata/record_projector.hpp"

#include <nlohmann/json.hpp>
#include <variant>

using namespace veclex;
using namespace veclex::metadata;
using nlohmann::json;

namespace {

template <class T>
bool holds(const index::NumericRestriction& r) { return std::holds_alternative<T>(r.value); }

} // namespace

TEST_CASE("build_text joins configured non-empty fields", "[projector]") {
    SECTION("Empty fields are skipped, not padded") {
        REQUIRE(build_text(json{{"title", "Hello"}, {"desc", ""}}, {"title", "desc"}) == "Hello");
    }

    SECTION("Configured order wins over record order") {
        json r{{"b", "second"}, {"a", "first"}, {"c", nullptr}};
        REQUIRE(build_text(r, {"a", "c", "b"}) == "first\nsecond");
    }

    SECTION("Non-string values use their text form") {
        json r{{"n", 42}, {"tags", json::array({"x", "y"})}, {"ok", true}};
        REQUIRE(build_text(r, {"n", "tags", "ok"}) == "42\n[\"x\",\"y\"]\nTrue");
    }

    SECTION("Missing fields and non-object records") {
        REQUIRE(build_text(json{{"a", "x"}}, {"missing"}).empty());
        REQUIRE(build_text(json::array({1, 2}), {"a"}).empty());
    }
}

TEST_CASE("as_nonempty_text never returns empty text", "[projector]") {
    REQUIRE(as_nonempty_text("") == " ");
    REQUIRE(as_nonempty_text(" \n\t ") == " ");
    REQUIRE(as_nonempty_text("  hello world \n") == "hello world");
}

TEST_CASE("build_metadata copies present fields only", "[projector]") {
    json r{{"title", "T"}, {"price", 9.5}, {"note", nullptr}};
    auto m = build_metadata(r, {"title", "note", "absent"});
    REQUIRE(m == json{{"title", "T"}, {"note", nullptr}});
    REQUIRE_FALSE(m.contains("absent"));
    REQUIRE(build_metadata(r, {}).is_object());
    REQUIRE(build_metadata(r, {}).empty());
}

TEST_CASE("build_restricts emits allow lists", "[projector]") {
    json r{
        {"color", "red"},
        {"tags", json::array({"a", nullptr, "", 3, true})},
        {"empty_list", json::array({nullptr, ""})},
        {"blank", ""},
        {"flag", false},
    };
    auto rs = build_restricts(r, {"color", "tags", "empty_list", "blank", "missing", "flag"});
    REQUIRE(rs.size() == 3);
    REQUIRE(rs[0] == index::Restriction{"color", {"red"}, {}});
    REQUIRE(rs[1] == index::Restriction{"tags", {"a", "3", "True"}, {}});
    REQUIRE(rs[2] == index::Restriction{"flag", {"False"}, {}});
}

TEST_CASE("build_numeric_restricts classifies values", "[projector]") {
    json r{
        {"count", 7},
        {"ratio", 0.25},
        {"as_text", " 12 "},
        {"created_at", "2024-01-01 12:00:00"},
        {"updated_at", "garbage"},
        {"flag", true},
        {"off", false},
        {"empty", ""},
        {"none", nullptr},
    };
    std::size_t skipped = 0;
    auto ns = build_numeric_restricts(
        r, {"count", "ratio", "as_text", "created_at", "updated_at", "flag", "off", "empty", "none", "missing"},
        {"created_at", "updated_at"}, &skipped);

    REQUIRE(ns.size() == 6);
    REQUIRE(ns[0].namespace_ == "count");
    REQUIRE(holds<std::int64_t>(ns[0]));
    REQUIRE(std::get<std::int64_t>(ns[0].value) == 7);

    REQUIRE(ns[1].namespace_ == "ratio");
    REQUIRE(ns[1].is_float());
    REQUIRE(std::get<double>(ns[1].value) == 0.25);

    REQUIRE(ns[2].namespace_ == "as_text");
    REQUIRE(std::get<std::int64_t>(ns[2].value) == 12);

    REQUIRE(ns[3].namespace_ == "created_at");
    REQUIRE(std::get<std::int64_t>(ns[3].value) == 1704110400);

    REQUIRE(ns[4].namespace_ == "flag");
    REQUIRE(holds<std::int64_t>(ns[4]));
    REQUIRE(std::get<std::int64_t>(ns[4].value) == 1);

    REQUIRE(ns[5].namespace_ == "off");
    REQUIRE(std::get<std::int64_t>(ns[5].value) == 0);

    // unparseable timestamp
    REQUIRE(skipped == 1);
}

TEST_CASE("parse_timestamp formats", "[projector][timestamp]") {
    SECTION("Numbers are epoch seconds") {
        REQUIRE(parse_timestamp(json(1700000000)) == 1700000000);
        REQUIRE(parse_timestamp(json(1700000000.9)) == 1700000000);
        REQUIRE(parse_timestamp(json(-5)) == -5);
    }

    SECTION("Booleans are 0 and 1") {
        REQUIRE(parse_timestamp(json(true)) == 1);
        REQUIRE(parse_timestamp(json(false)) == 0);
    }

    SECTION("Text formats are read as UTC") {
        REQUIRE(parse_timestamp(json("2024-01-01 12:00:00")) == 1704110400);
        REQUIRE(parse_timestamp(json("2024-01-01T12:00:00")) == 1704110400);
        REQUIRE(parse_timestamp(json("01/01/2024 12:00")) == 1704110400);
        REQUIRE(parse_timestamp(json("31/12/1970 00:00")) == 364 * 86400);
    }

    SECTION("Unparseable values") {
        REQUIRE_FALSE(parse_timestamp(json("not-a-date")).has_value());
        REQUIRE_FALSE(parse_timestamp(json("2024-02-30 00:00:00")).has_value());
        REQUIRE_FALSE(parse_timestamp(json("2024-01-01 25:00:00")).has_value());
        REQUIRE_FALSE(parse_timestamp(json("")).has_value());
        REQUIRE_FALSE(parse_timestamp(json(nullptr)).has_value());
        REQUIRE_FALSE(parse_timestamp(json::object()).has_value());
        REQUIRE_FALSE(parse_timestamp(json::array({1})).has_value());
    }
}

TEST_CASE("Projection is idempotent", "[projector]") {
    FieldSelection sel;
    sel.text_fields = {"title", "body"};
    sel.metadata_fields = {"title", "price"};
    sel.restrict_fields = {"category", "tags"};
    sel.numeric_restrict_fields = {"price", "created_at"};

    json r{
        {"title", "Lamp"}, {"body", "Warm light"}, {"price", 19.99},
        {"category", "home"}, {"tags", json::array({"light", "desk"})},
        {"created_at", "15/03/2023 08:30"},
    };
    auto a = project(r, sel);
    auto b = project(r, sel);
    REQUIRE(a.text == b.text);
    REQUIRE(a.metadata == b.metadata);
    REQUIRE(a.restricts == b.restricts);
    REQUIRE(a.numeric_restricts == b.numeric_restricts);
    REQUIRE(a.text == "Lamp\nWarm light");
    REQUIRE(a.restricts.size() == 2);
    REQUIRE(a.numeric_restricts.size() == 2);
    REQUIRE(a.skipped_values == 0);
}
