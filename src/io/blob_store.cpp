#include "veclex/io/blob_store.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace veclex::io {

namespace {

constexpr std::string_view kScheme = "gs://";

auto strip_slashes(std::string_view s) -> std::string_view {
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return s;
}

auto has_parent_segment(std::string_view key) -> bool {
    std::size_t pos = 0;
    while (pos <= key.size()) {
        auto end = key.find('/', pos);
        if (end == std::string_view::npos) end = key.size();
        if (key.substr(pos, end - pos) == "..") return true;
        pos = end + 1;
    }
    return false;
}

} // anonymous namespace

auto parse_object_prefix(std::string_view uri) -> std::expected<ObjectPrefix, core::error> {
    using core::error; using core::error_code;
    if (uri.substr(0, kScheme.size()) != kScheme) {
        return std::unexpected(error{error_code::invalid_argument,
            "object prefix must start with gs://: " + std::string(uri), "io.blob"});
    }
    auto rest = uri.substr(kScheme.size());
    const auto slash = rest.find('/');
    ObjectPrefix out;
    out.bucket = std::string(rest.substr(0, slash));
    if (slash != std::string_view::npos) {
        auto path = rest.substr(slash + 1);
        while (!path.empty() && path.front() == '/') path.remove_prefix(1);
        out.path = std::string(path);
    }
    if (out.bucket.empty()) {
        return std::unexpected(error{error_code::invalid_argument,
            "object prefix has no bucket: " + std::string(uri), "io.blob"});
    }
    return out;
}

auto to_object_key(std::string_view prefix) -> std::expected<std::string, core::error> {
    if (prefix.find("://") != std::string_view::npos) {
        auto parsed = parse_object_prefix(prefix);
        if (!parsed) return std::unexpected(parsed.error());
        return join_object_name(parsed->bucket, parsed->path);
    }
    while (!prefix.empty() && prefix.front() == '/') prefix.remove_prefix(1);
    return std::string(prefix);
}

auto join_object_name(std::string_view prefix, std::string_view leaf) -> std::string {
    while (!prefix.empty() && prefix.back() == '/') prefix.remove_suffix(1);
    while (!leaf.empty() && leaf.front() == '/') leaf.remove_prefix(1);
    if (prefix.empty()) return std::string(leaf);
    if (leaf.empty()) return std::string(prefix);
    std::string out;
    out.reserve(prefix.size() + 1 + leaf.size());
    out.append(prefix).push_back('/');
    out.append(leaf);
    return out;
}

LocalBlobStore::LocalBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

auto LocalBlobStore::resolve(std::string_view name) const
    -> std::expected<std::filesystem::path, core::error> {
    using core::error; using core::error_code;
    auto key = to_object_key(name);
    if (!key) return std::unexpected(key.error());
    if (has_parent_segment(*key)) {
        return std::unexpected(error{error_code::invalid_argument,
            "object name escapes the store root: " + std::string(name), "io.blob"});
    }
    return root_ / std::filesystem::path(std::string(strip_slashes(*key)));
}

auto LocalBlobStore::list(std::string_view prefix) const
    -> std::expected<std::vector<std::string>, core::error> {
    using core::error; using core::error_code;
    auto dir = resolve(prefix);
    if (!dir) return std::unexpected(dir.error());

    std::vector<std::string> names;
    std::error_code ec;
    if (!std::filesystem::is_directory(*dir, ec)) return names;

    std::filesystem::recursive_directory_iterator it(*dir, ec), end;
    if (ec) {
        return std::unexpected(error{error_code::io_failed,
            "cannot list " + dir->string() + ": " + ec.message(), "io.blob"});
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(error{error_code::io_failed,
                "listing failed under " + dir->string() + ": " + ec.message(), "io.blob"});
        }
        if (!it->is_regular_file(ec)) continue;
        names.push_back(std::filesystem::relative(it->path(), root_, ec).generic_string());
        if (ec) {
            return std::unexpected(error{error_code::io_failed,
                "cannot relativize " + it->path().string(), "io.blob"});
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

auto LocalBlobStore::read(const std::string& name) const
    -> std::expected<std::string, core::error> {
    using core::error; using core::error_code;
    auto p = resolve(name);
    if (!p) return std::unexpected(p.error());
    std::ifstream in(*p, std::ios::binary);
    if (!in.good()) {
        return std::unexpected(error{error_code::not_found, "object open failed: " + name, "io.blob"});
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(error{error_code::io_failed, "object read failed: " + name, "io.blob"});
    }
    return oss.str();
}

auto LocalBlobStore::write(const std::string& name, std::string_view content)
    -> std::expected<void, core::error> {
    using core::error; using core::error_code;
    auto p = resolve(name);
    if (!p) return std::unexpected(p.error());

    std::error_code ec;
    std::filesystem::create_directories(p->parent_path(), ec);
    if (ec) {
        return std::unexpected(error{error_code::io_failed,
            "cannot create " + p->parent_path().string() + ": " + ec.message(), "io.blob"});
    }
    // Write to a sibling temp file then rename so readers never see a partial object.
    auto tmp = *p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            return std::unexpected(error{error_code::io_failed, "object open failed: " + name, "io.blob"});
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out.good()) {
            std::error_code ec2; std::filesystem::remove(tmp, ec2);
            return std::unexpected(error{error_code::io_failed, "object write failed: " + name, "io.blob"});
        }
    }
    std::filesystem::rename(tmp, *p, ec);
    if (ec) {
        std::error_code ec2; std::filesystem::remove(tmp, ec2);
        return std::unexpected(error{error_code::io_failed,
            "object rename failed: " + name + ": " + ec.message(), "io.blob"});
    }
    return {};
}

} // namespace veclex::io
