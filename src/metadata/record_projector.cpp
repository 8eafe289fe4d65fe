#include "veclex/metadata/record_projector.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <limits>
#include <regex>

namespace veclex::metadata {

namespace {

// Field lookup that treats non-object records as having no fields.
auto find_field(const Record& record, const std::string& field) -> const nlohmann::json* {
    if (!record.is_object()) return nullptr;
    auto it = record.find(field);
    return it == record.end() ? nullptr : &*it;
}

auto contains(const std::vector<std::string>& fields, const std::string& field) -> bool {
    return std::find(fields.begin(), fields.end(), field) != fields.end();
}

auto trim(std::string_view s) -> std::string_view {
    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

auto to_int(const std::string& s) -> int { return std::stoi(s); }

// Calendar fields to epoch seconds (UTC); nullopt for impossible dates.
auto civil_to_epoch(int y, int mo, int d, int h, int mi, int sec) -> std::optional<std::int64_t> {
    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || sec < 0 || sec > 59) return std::nullopt;
    const auto days_since_epoch = sys_days{ymd}.time_since_epoch().count();
    return static_cast<std::int64_t>(days_since_epoch) * 86400 + h * 3600 + mi * 60 + sec;
}

auto parse_timestamp_text(const std::string& text) -> std::optional<std::int64_t> {
    // Tried in order; the first format that matches decides the result.
    static const std::regex day_first(R"(^(\d{1,2})/(\d{1,2})/(\d{4}) (\d{1,2}):(\d{1,2})$)");
    static const std::regex iso_space(R"(^(\d{4})-(\d{1,2})-(\d{1,2}) (\d{1,2}):(\d{1,2}):(\d{1,2})$)");
    static const std::regex iso_t(R"(^(\d{4})-(\d{1,2})-(\d{1,2})T(\d{1,2}):(\d{1,2}):(\d{1,2})$)");

    std::smatch m;
    if (std::regex_match(text, m, day_first)) {
        if (auto ts = civil_to_epoch(to_int(m[3]), to_int(m[2]), to_int(m[1]),
                                     to_int(m[4]), to_int(m[5]), 0)) {
            return ts;
        }
    }
    for (const auto* rx : {&iso_space, &iso_t}) {
        if (std::regex_match(text, m, *rx)) {
            if (auto ts = civil_to_epoch(to_int(m[1]), to_int(m[2]), to_int(m[3]),
                                         to_int(m[4]), to_int(m[5]), to_int(m[6]))) {
                return ts;
            }
        }
    }
    return std::nullopt;
}

// Non-timestamp numeric value; nullopt when it cannot be classified.
auto resolve_numeric(const nlohmann::json& value) -> std::optional<index::NumericValue> {
    if (value.is_boolean()) {
        return index::NumericValue{std::int64_t{value.get<bool>() ? 1 : 0}};
    }
    if (value.is_number_float()) {
        const double v = value.get<double>();
        if (!std::isfinite(v)) return std::nullopt;
        return index::NumericValue{v};
    }
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
        return index::NumericValue{static_cast<std::int64_t>(v)};
    }
    if (value.is_number_integer()) {
        return index::NumericValue{value.get<std::int64_t>()};
    }
    if (value.is_string()) {
        const auto text = trim(value.get_ref<const std::string&>());
        std::int64_t v = 0;
        const auto* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, v);
        if (ec == std::errc{} && ptr == end && !text.empty()) {
            return index::NumericValue{v};
        }
    }
    return std::nullopt;
}

} // anonymous namespace

auto is_empty_value(const nlohmann::json& value) noexcept -> bool {
    return value.is_null() || (value.is_string() && value.get_ref<const std::string&>().empty());
}

auto stringify(const nlohmann::json& value) -> std::string {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_boolean()) return value.get<bool>() ? "True" : "False";
    return value.dump();
}

auto as_nonempty_text(std::string_view text) -> std::string {
    const auto trimmed = trim(text);
    return trimmed.empty() ? std::string(" ") : std::string(trimmed);
}

auto build_text(const Record& record, const std::vector<std::string>& text_fields) -> std::string {
    std::string out;
    bool first = true;
    for (const auto& field : text_fields) {
        const auto* value = find_field(record, field);
        if (value == nullptr || is_empty_value(*value)) continue;
        if (!first) out.push_back('\n');
        out += stringify(*value);
        first = false;
    }
    return out;
}

auto build_metadata(const Record& record, const std::vector<std::string>& metadata_fields) -> Metadata {
    Metadata out = Metadata::object();
    for (const auto& field : metadata_fields) {
        if (const auto* value = find_field(record, field)) {
            out[field] = *value;
        }
    }
    return out;
}

auto build_restricts(const Record& record, const std::vector<std::string>& restrict_fields)
    -> std::vector<index::Restriction> {
    std::vector<index::Restriction> restricts;
    for (const auto& field : restrict_fields) {
        const auto* value = find_field(record, field);
        if (value == nullptr || is_empty_value(*value)) continue;

        index::Restriction r;
        r.namespace_ = field;
        if (value->is_array()) {
            for (const auto& item : *value) {
                if (!is_empty_value(item)) r.allow.push_back(stringify(item));
            }
        } else {
            r.allow.push_back(stringify(*value));
        }
        if (!r.allow.empty()) {
            restricts.push_back(std::move(r));
        }
    }
    return restricts;
}

auto build_numeric_restricts(const Record& record,
                             const std::vector<std::string>& numeric_fields,
                             const std::vector<std::string>& timestamp_fields,
                             std::size_t* skipped)
    -> std::vector<index::NumericRestriction> {
    std::vector<index::NumericRestriction> out;
    for (const auto& field : numeric_fields) {
        const auto* raw = find_field(record, field);
        if (raw == nullptr || is_empty_value(*raw)) continue;

        std::optional<index::NumericValue> value;
        if (contains(timestamp_fields, field)) {
            if (auto ts = parse_timestamp(*raw)) value = index::NumericValue{*ts};
        } else {
            value = resolve_numeric(*raw);
        }

        if (!value) {
            if (skipped) ++*skipped;
            continue;
        }
        out.push_back(index::NumericRestriction{field, *value});
    }
    return out;
}

auto parse_timestamp(const nlohmann::json& value) -> std::optional<std::int64_t> {
    if (is_empty_value(value)) return std::nullopt;
    if (value.is_boolean()) return value.get<bool>() ? 1 : 0;
    if (value.is_number_integer() && !value.is_number_unsigned()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_unsigned()) {
        const auto v = value.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
        return static_cast<std::int64_t>(v);
    }
    if (value.is_number_float()) {
        const double v = std::trunc(value.get<double>());
        if (!std::isfinite(v) || v < -9.2e18 || v > 9.2e18) return std::nullopt;
        return static_cast<std::int64_t>(v);
    }
    if (value.is_string()) {
        return parse_timestamp_text(value.get<std::string>());
    }
    return std::nullopt;
}

auto project(const Record& record, const FieldSelection& selection) -> Projection {
    Projection p;
    p.text = build_text(record, selection.text_fields);
    p.metadata = build_metadata(record, selection.metadata_fields);
    p.restricts = build_restricts(record, selection.restrict_fields);
    p.numeric_restricts = build_numeric_restricts(record, selection.numeric_restrict_fields,
                                                  selection.timestamp_fields, &p.skipped_values);
    return p;
}

} // namespace veclex::metadata
