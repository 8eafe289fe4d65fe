#include "veclex/io/jsonl.hpp"

#include <sstream>

namespace veclex::io {

namespace {

auto strip(std::string_view s) -> std::string_view {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// Returns false when the visitor asked to stop.
auto visit_line(std::string_view raw, const ObjectVisitor& visit, LineStats& stats) -> bool {
    const auto line = strip(raw);
    if (line.empty()) return true;
    ++stats.lines;

    auto item = nlohmann::json::parse(line.begin(), line.end(), nullptr, /*allow_exceptions=*/false);
    if (item.is_discarded() || !item.is_object()) {
        ++stats.skipped;
        return true;
    }
    ++stats.objects;
    if (!visit(std::move(item))) {
        stats.stopped = true;
        return false;
    }
    return true;
}

} // anonymous namespace

auto for_each_object(std::istream& in, const ObjectVisitor& visit) -> LineStats {
    LineStats stats;
    std::string line;
    while (std::getline(in, line)) {
        if (!visit_line(line, visit, stats)) break;
    }
    return stats;
}

auto for_each_object(std::string_view content, const ObjectVisitor& visit) -> LineStats {
    LineStats stats;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::size_t end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        if (!visit_line(content.substr(pos, end - pos), visit, stats)) break;
        pos = end + 1;
    }
    return stats;
}

auto read_objects(std::string_view content, LineStats* stats) -> std::vector<nlohmann::json> {
    std::vector<nlohmann::json> out;
    auto s = for_each_object(content, [&out](nlohmann::json&& item) {
        out.push_back(std::move(item));
        return true;
    });
    if (stats) *stats = s;
    return out;
}

auto write_lines(const std::vector<nlohmann::json>& items) -> std::string {
    std::ostringstream oss;
    for (const auto& item : items) {
        // ASCII-only output, as the vector-search import expects.
        oss << item.dump(-1, ' ', /*ensure_ascii=*/true) << '\n';
    }
    return oss.str();
}

} // namespace veclex::io
