#include "veclex/index/datapoint.hpp"

#include <cmath>

namespace veclex::index {

namespace {

auto integrity_error(std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{core::error_code::data_integrity, std::move(message), "index.datapoint"});
}

// First present, non-null member among the given keys.
auto first_of(const nlohmann::json& obj, std::initializer_list<const char*> keys) -> const nlohmann::json* {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

// Like first_of, but an empty string or empty array also counts as absent.
auto first_filled_of(const nlohmann::json& obj, std::initializer_list<const char*> keys) -> const nlohmann::json* {
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) continue;
        if ((it->is_string() || it->is_array()) && it->empty()) continue;
        return &*it;
    }
    return nullptr;
}

auto to_token_list(const nlohmann::json* arr) -> std::optional<std::vector<std::string>> {
    std::vector<std::string> out;
    if (arr == nullptr) return out;
    if (!arr->is_array()) return std::nullopt;
    out.reserve(arr->size());
    for (const auto& v : *arr) {
        out.push_back(v.is_string() ? v.get<std::string>() : v.dump());
    }
    return out;
}

auto parse_dense(const nlohmann::json& arr) -> std::expected<std::vector<float>, core::error> {
    if (!arr.is_array()) return integrity_error("embedding must be an array");
    std::vector<float> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.is_number()) return integrity_error("embedding values must be numbers");
        out.push_back(v.get<float>());
    }
    if (out.empty()) return integrity_error("embedding must not be empty");
    return out;
}

auto parse_sparse(const nlohmann::json& obj) -> std::expected<TermBucketVector, core::error> {
    if (!obj.is_object()) return integrity_error("sparse_embedding must be an object");
    const auto dims = obj.find("dimensions");
    const auto vals = obj.find("values");
    if (dims == obj.end() || vals == obj.end() || !dims->is_array() || !vals->is_array()) {
        return integrity_error("sparse_embedding needs dimensions and values arrays");
    }
    if (dims->size() != vals->size()) {
        return integrity_error("sparse_embedding dimensions and values differ in length");
    }

    TermBucketVector vec;
    vec.dimensions.reserve(dims->size());
    vec.values.reserve(vals->size());
    for (const auto& d : *dims) {
        if (!d.is_number_unsigned() || d.get<std::uint64_t>() > 0xFFFFFFFFull) {
            return integrity_error("sparse_embedding dimensions must be 32-bit unsigned integers");
        }
        vec.dimensions.push_back(d.get<std::uint32_t>());
    }
    for (const auto& v : *vals) {
        if (!v.is_number()) return integrity_error("sparse_embedding values must be numbers");
        vec.values.push_back(v.get<float>());
    }
    if (!vec.is_valid()) return integrity_error("sparse_embedding has duplicate dimensions");
    return vec;
}

auto parse_restrict_list(const nlohmann::json& arr) -> std::expected<std::vector<Restriction>, core::error> {
    if (!arr.is_array()) return integrity_error("restricts must be an array");
    std::vector<Restriction> out;
    for (const auto& item : arr) {
        if (!item.is_object()) return integrity_error("restrict must be an object");
        const auto* ns = first_of(item, {"namespace"});
        if (ns == nullptr || !ns->is_string() || ns->get_ref<const std::string&>().empty()) {
            return integrity_error("restrict needs a namespace");
        }
        auto allow = to_token_list(first_filled_of(item, {"allow", "allow_list"}));
        auto deny = to_token_list(first_filled_of(item, {"deny", "deny_list"}));
        if (!allow || !deny) return integrity_error("restrict allow/deny must be arrays");
        out.push_back(Restriction{ns->get<std::string>(), std::move(*allow), std::move(*deny)});
    }
    return out;
}

auto parse_numeric_list(const nlohmann::json& arr)
    -> std::expected<std::vector<NumericRestriction>, core::error> {
    if (!arr.is_array()) return integrity_error("numeric_restricts must be an array");
    std::vector<NumericRestriction> out;
    for (const auto& item : arr) {
        if (!item.is_object()) return integrity_error("numeric restrict must be an object");
        const auto* ns = first_of(item, {"namespace"});
        if (ns == nullptr || !ns->is_string() || ns->get_ref<const std::string&>().empty()) {
            return integrity_error("numeric restrict needs a namespace");
        }
        const auto* as_int = first_of(item, {"value_int"});
        const auto* as_float = first_of(item, {"value_float", "value_double"});
        if ((as_int != nullptr) == (as_float != nullptr)) {
            return integrity_error("numeric restrict needs exactly one of value_int or value_float");
        }

        NumericRestriction r;
        r.namespace_ = ns->get<std::string>();
        if (as_int) {
            if (!as_int->is_number_integer()) return integrity_error("value_int must be an integer");
            r.value = as_int->get<std::int64_t>();
        } else {
            if (!as_float->is_number()) return integrity_error("value_float must be a number");
            r.value = as_float->get<double>();
        }
        out.push_back(std::move(r));
    }
    return out;
}

} // anonymous namespace

auto id_to_string(const nlohmann::json& id) -> std::optional<std::string> {
    if (id.is_string()) {
        const auto& s = id.get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (id.is_number_unsigned()) return std::to_string(id.get<std::uint64_t>());
    if (id.is_number_integer()) return std::to_string(id.get<std::int64_t>());
    return std::nullopt;
}

auto assemble(const nlohmann::json& id,
              std::vector<float> dense_vector,
              std::optional<TermBucketVector> sparse_vector,
              std::vector<Restriction> restricts,
              std::vector<NumericRestriction> numeric_restricts,
              Metadata metadata)
    -> std::expected<IndexEntry, core::error> {
    auto id_text = id_to_string(id);
    if (!id_text) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "entry id must be a non-empty string or integer", "index.assemble"});
    }
    if (dense_vector.empty()) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "dense vector must not be empty (id=" + *id_text + ")", "index.assemble"});
    }
    if (sparse_vector && !sparse_vector->is_valid()) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "sparse vector is malformed (id=" + *id_text + ")", "index.assemble"});
    }
    if (!metadata.is_null() && !metadata.is_object()) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "metadata must be an object (id=" + *id_text + ")", "index.assemble"});
    }

    IndexEntry entry;
    entry.id = std::move(*id_text);
    entry.dense_vector = std::move(dense_vector);
    if (sparse_vector && sparse_vector->has_signal()) {
        entry.sparse_vector = std::move(sparse_vector);
    }
    entry.restricts = std::move(restricts);
    entry.numeric_restricts = std::move(numeric_restricts);
    entry.metadata = metadata.is_null() ? Metadata::object() : std::move(metadata);
    return entry;
}

auto sparse_to_json(const TermBucketVector& vec) -> nlohmann::json {
    return nlohmann::json{{"dimensions", vec.dimensions}, {"values", vec.values}};
}

auto restrictions_to_json(const std::vector<Restriction>& restricts) -> nlohmann::json {
    auto arr = nlohmann::json::array();
    for (const auto& r : restricts) {
        nlohmann::json item{{"namespace", r.namespace_}, {"allow", r.allow}};
        if (!r.deny.empty()) item["deny"] = r.deny;
        arr.push_back(std::move(item));
    }
    return arr;
}

auto to_json(const IndexEntry& entry) -> nlohmann::json {
    nlohmann::json j;
    j["id"] = entry.id;
    j["embedding"] = entry.dense_vector;
    if (entry.sparse_vector && !entry.sparse_vector->empty()) {
        j["sparse_embedding"] = sparse_to_json(*entry.sparse_vector);
    }
    if (!entry.restricts.empty()) {
        j["restricts"] = restrictions_to_json(entry.restricts);
    }
    if (!entry.numeric_restricts.empty()) {
        auto arr = nlohmann::json::array();
        for (const auto& r : entry.numeric_restricts) {
            nlohmann::json item{{"namespace", r.namespace_}};
            if (const auto* f = std::get_if<double>(&r.value)) {
                item["value_float"] = *f;
            } else {
                item["value_int"] = std::get<std::int64_t>(r.value);
            }
            arr.push_back(std::move(item));
        }
        j["numeric_restricts"] = std::move(arr);
    }
    j["embedding_metadata"] = entry.metadata.is_object() ? entry.metadata : Metadata::object();
    if (entry.crowding_tag) {
        j["crowding_tag"] = *entry.crowding_tag;
    }
    return j;
}

auto to_line(const IndexEntry& entry) -> std::string {
    return to_json(entry).dump();
}

auto parse(const nlohmann::json& item) -> std::expected<IndexEntry, core::error> {
    if (!item.is_object()) return integrity_error("entry must be a JSON object");

    IndexEntry entry;
    const auto* id = first_of(item, {"id", "datapoint_id"});
    std::optional<std::string> id_text;
    if (id) id_text = id_to_string(*id);
    if (!id_text) return integrity_error("entry is missing a usable id");
    entry.id = std::move(*id_text);

    const auto* embedding = first_of(item, {"embedding", "feature_vector"});
    if (embedding == nullptr) return integrity_error("entry " + entry.id + " is missing its embedding");
    auto dense = parse_dense(*embedding);
    if (!dense) return std::unexpected(dense.error());
    entry.dense_vector = std::move(*dense);

    if (const auto* sparse = first_of(item, {"sparse_embedding"})) {
        auto vec = parse_sparse(*sparse);
        if (!vec) return std::unexpected(vec.error());
        if (vec->has_signal()) entry.sparse_vector = std::move(*vec);
    }

    if (const auto* restricts = first_of(item, {"restricts"})) {
        auto list = parse_restrict_list(*restricts);
        if (!list) return std::unexpected(list.error());
        entry.restricts = std::move(*list);
    }

    if (const auto* numeric = first_of(item, {"numeric_restricts"})) {
        auto list = parse_numeric_list(*numeric);
        if (!list) return std::unexpected(list.error());
        entry.numeric_restricts = std::move(*list);
    }

    if (const auto* metadata = first_of(item, {"embedding_metadata", "metadata"})) {
        if (!metadata->is_object()) return integrity_error("embedding_metadata must be an object");
        entry.metadata = *metadata;
    }

    if (const auto* tag = first_of(item, {"crowding_tag"})) {
        if (tag->is_string()) {
            entry.crowding_tag = tag->get<std::string>();
        } else if (tag->is_object() && tag->contains("crowding_attribute")
                   && (*tag)["crowding_attribute"].is_string()) {
            entry.crowding_tag = (*tag)["crowding_attribute"].get<std::string>();
        } else {
            return integrity_error("crowding_tag must be a string");
        }
    }

    return entry;
}

auto parse_line(std::string_view line) -> std::expected<IndexEntry, core::error> {
    auto item = nlohmann::json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions=*/false);
    if (item.is_discarded()) return integrity_error("malformed JSON line");
    return parse(item);
}

auto parse_restrictions(const nlohmann::json& payload)
    -> std::expected<std::vector<Restriction>, core::error> {
    std::vector<Restriction> filters;
    if (payload.is_null()) return filters;
    if (!payload.is_array()) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
            "restricts must be an array", "search.filters"});
    }
    for (const auto& item : payload) {
        if (!item.is_object()) {
            return std::unexpected(core::error{core::error_code::invalid_argument,
                "each restrict must be an object", "search.filters"});
        }
        const auto* ns = first_filled_of(item, {"namespace", "name"});
        if (ns == nullptr || !ns->is_string() || ns->get_ref<const std::string&>().empty()) continue;

        auto allow = to_token_list(first_filled_of(item, {"allow", "allow_list", "allow_tokens"}));
        auto deny = to_token_list(first_filled_of(item, {"deny", "deny_list", "deny_tokens"}));
        if (!allow || !deny) {
            return std::unexpected(core::error{core::error_code::invalid_argument,
                "restrict allow/deny must be arrays", "search.filters"});
        }
        filters.push_back(Restriction{ns->get<std::string>(), std::move(*allow), std::move(*deny)});
    }
    return filters;
}

} // namespace veclex::index
