/** \file datapoint_test.cpp
 *  \brief Unit tests for index entry assembly, serialization and parsing.
 */

#include <catch2/catch_test_macros.hpp>

#include "veclex/index/datapoint.hpp"

#include <nlohmann/json.hpp>

using namespace veclex;
using namespace veclex::index;
using nlohmann::json;

namespace {

IndexEntry full_entry() {
    auto e = assemble(json("doc-1"), {0.6f, 0.8f}, TermBucketVector{{3, 9}, {1.5f, 0.25f}},
                      {Restriction{"color", {"red", "blue"}, {"green"}}},
                      {NumericRestriction{"count", std::int64_t{7}}, NumericRestriction{"ratio", 0.5}},
                      json{{"title", "Lamp"}, {"price", 19.5}});
    REQUIRE(e.has_value());
    return *e;
}

} // namespace

TEST_CASE("assemble validates its inputs", "[datapoint]") {
    SECTION("Numeric ids are coerced to text") {
        auto e = assemble(json(42), {1.0f}, std::nullopt, {}, {}, json::object());
        REQUIRE(e.has_value());
        REQUIRE(e->id == "42");
    }

    SECTION("Empty or missing id is rejected") {
        for (const auto& id : {json(""), json(nullptr), json(true), json::array()}) {
            auto e = assemble(id, {1.0f}, std::nullopt, {}, {}, json::object());
            REQUIRE_FALSE(e.has_value());
            REQUIRE(e.error().code == core::error_code::invalid_argument);
            REQUIRE(e.error().component == "index.assemble");
        }
    }

    SECTION("Empty dense vector is rejected") {
        auto e = assemble(json("x"), {}, std::nullopt, {}, {}, json::object());
        REQUIRE_FALSE(e.has_value());
        REQUIRE(e.error().code == core::error_code::invalid_argument);
    }

    SECTION("Malformed sparse vector is rejected") {
        auto e = assemble(json("x"), {1.0f}, TermBucketVector{{1, 2}, {1.0f}}, {}, {}, json::object());
        REQUIRE_FALSE(e.has_value());
    }

    SECTION("Sparse vector without signal is dropped") {
        auto empty = assemble(json("x"), {1.0f}, TermBucketVector{}, {}, {}, json::object());
        REQUIRE(empty.has_value());
        REQUIRE_FALSE(empty->sparse_vector.has_value());

        auto zeros = assemble(json("x"), {1.0f}, TermBucketVector{{4}, {0.0f}}, {}, {}, json::object());
        REQUIRE(zeros.has_value());
        REQUIRE_FALSE(zeros->sparse_vector.has_value());
    }

    SECTION("Null metadata becomes an empty object") {
        auto e = assemble(json("x"), {1.0f}, std::nullopt, {}, {}, json());
        REQUIRE(e.has_value());
        REQUIRE(e->metadata == json::object());
    }
}

TEST_CASE("to_json omits empty optional members", "[datapoint]") {
    auto e = assemble(json("x"), {1.0f, 0.0f}, std::nullopt, {}, {}, json::object());
    REQUIRE(e.has_value());
    auto j = to_json(*e);
    REQUIRE(j["id"] == "x");
    REQUIRE(j["embedding"].size() == 2);
    REQUIRE(j["embedding_metadata"] == json::object());
    REQUIRE_FALSE(j.contains("sparse_embedding"));
    REQUIRE_FALSE(j.contains("restricts"));
    REQUIRE_FALSE(j.contains("numeric_restricts"));
    REQUIRE_FALSE(j.contains("crowding_tag"));
}

TEST_CASE("to_json wire layout", "[datapoint]") {
    auto j = to_json(full_entry());
    REQUIRE(j["sparse_embedding"] == json{{"dimensions", {3, 9}}, {"values", {1.5, 0.25}}});
    REQUIRE(j["restricts"][0]["namespace"] == "color");
    REQUIRE(j["restricts"][0]["allow"] == json{"red", "blue"});
    REQUIRE(j["restricts"][0]["deny"] == json{"green"});
    REQUIRE(j["numeric_restricts"][0] == json{{"namespace", "count"}, {"value_int", 7}});
    REQUIRE(j["numeric_restricts"][1] == json{{"namespace", "ratio"}, {"value_float", 0.5}});
    REQUIRE(j["embedding_metadata"]["title"] == "Lamp");
}

TEST_CASE("Entries round-trip through parse", "[datapoint]") {
    SECTION("All optional members present") {
        auto original = full_entry();
        original.crowding_tag = "shelf-1";
        auto back = parse_line(to_line(original));
        REQUIRE(back.has_value());
        REQUIRE(*back == original);
    }

    SECTION("Optional members absent restore defaults") {
        auto back = parse(json{{"id", "old"}, {"embedding", {0.1, 0.2}}});
        REQUIRE(back.has_value());
        REQUIRE(back->id == "old");
        REQUIRE(back->dense_vector.size() == 2);
        REQUIRE_FALSE(back->sparse_vector.has_value());
        REQUIRE(back->restricts.empty());
        REQUIRE(back->numeric_restricts.empty());
        REQUIRE(back->metadata == json::object());
        REQUIRE_FALSE(back->crowding_tag.has_value());
    }

    SECTION("Historical aliases are accepted") {
        json item{
            {"datapoint_id", 17},
            {"feature_vector", {1, 2}},
            {"restricts", {{{"namespace", "n"}, {"allow_list", {"a"}}, {"deny_list", {"b"}}}}},
            {"numeric_restricts", {{{"namespace", "d"}, {"value_double", 1.5}}}},
            {"metadata", {{"k", "v"}}},
            {"crowding_tag", {{"crowding_attribute", "grp"}}},
        };
        auto back = parse(item);
        REQUIRE(back.has_value());
        REQUIRE(back->id == "17");
        REQUIRE(back->restricts.front() == Restriction{"n", {"a"}, {"b"}});
        REQUIRE(back->numeric_restricts.front().is_float());
        REQUIRE(back->metadata == json{{"k", "v"}});
        REQUIRE(back->crowding_tag == "grp");
    }
}

TEST_CASE("parse rejects malformed entries", "[datapoint]") {
    auto expect_integrity = [](const json& item) {
        auto r = parse(item);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code == core::error_code::data_integrity);
    };
    expect_integrity(json::array());
    expect_integrity(json{{"embedding", {1.0}}});
    expect_integrity(json{{"id", "x"}});
    expect_integrity(json{{"id", "x"}, {"embedding", {"a"}}});
    expect_integrity(json{{"id", "x"}, {"embedding", {1.0}}, {"sparse_embedding", {{"dimensions", {1}}}}});
    expect_integrity(json{{"id", "x"}, {"embedding", {1.0}},
                          {"sparse_embedding", {{"dimensions", {-1}}, {"values", {1.0}}}}});
    expect_integrity(json{{"id", "x"}, {"embedding", {1.0}},
                          {"numeric_restricts", {{{"namespace", "n"}, {"value_int", 1}, {"value_float", 1.0}}}}});
    expect_integrity(json{{"id", "x"}, {"embedding", {1.0}}, {"embedding_metadata", "text"}});

    REQUIRE_FALSE(parse_line("{not json").has_value());
}

TEST_CASE("parse_restrictions builds query filters", "[datapoint][filters]") {
    json payload = json::array({
        {{"namespace", "color"}, {"allow", {"red"}}},
        {{"name", "size"}, {"allow_tokens", {"L"}}, {"deny_tokens", {"XL"}}},
        {{"allow", {"orphan"}}},
    });
    auto filters = parse_restrictions(payload);
    REQUIRE(filters.has_value());
    REQUIRE(filters->size() == 2);
    REQUIRE((*filters)[0] == Restriction{"color", {"red"}, {}});
    REQUIRE((*filters)[1] == Restriction{"size", {"L"}, {"XL"}});

    REQUIRE(parse_restrictions(json()).value().empty());
    REQUIRE_FALSE(parse_restrictions(json{{"namespace", "x"}}).has_value());
    REQUIRE_FALSE(parse_restrictions(json::array({1})).has_value());
    REQUIRE_FALSE(parse_restrictions(json::array({{{"namespace", "x"}, {"allow", "red"}}})).has_value());
}

TEST_CASE("Empty alias values fall through to the next key", "[datapoint][filters]") {
    SECTION("Query filters") {
        json payload = json::array({
            {{"namespace", ""}, {"name", "color"}, {"allow", json::array()}, {"allow_list", {"red"}}},
            {{"namespace", "size"}, {"allow_list", {"L"}}, {"deny", json::array()}, {"deny_tokens", {"XL"}}},
            {{"namespace", ""}, {"name", ""}, {"allow", {"orphan"}}},
        });
        auto filters = parse_restrictions(payload);
        REQUIRE(filters.has_value());
        REQUIRE(filters->size() == 2);
        REQUIRE((*filters)[0] == Restriction{"color", {"red"}, {}});
        REQUIRE((*filters)[1] == Restriction{"size", {"L"}, {"XL"}});
    }

    SECTION("Stored entries") {
        json item{
            {"id", "x"},
            {"embedding", {1.0}},
            {"restricts", {{{"namespace", "n"}, {"allow", json::array()}, {"allow_list", {"a"}},
                            {"deny", json::array()}, {"deny_list", {"b"}}}}},
        };
        auto back = parse(item);
        REQUIRE(back.has_value());
        REQUIRE(back->restricts.front() == Restriction{"n", {"a"}, {"b"}});
    }
}
