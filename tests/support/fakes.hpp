#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <veclex/io/blob_store.hpp>
#include <veclex/service.hpp>

namespace test_support {

// In-memory records with an optional failure to return from fetch().
class VectorRecordSource final : public veclex::RecordSource {
public:
  explicit VectorRecordSource(std::vector<veclex::Record> records) : records_(std::move(records)) {}

  auto fetch() -> std::expected<std::vector<veclex::Record>, veclex::core::error> override {
    if (failure) return std::unexpected(*failure);
    return records_;
  }

  std::optional<veclex::core::error> failure;

private:
  std::vector<veclex::Record> records_;
};

// Deterministic embedder: component i of a text's vector is (length + i + 1).
class FakeEmbedder final : public veclex::DenseEmbedder {
public:
  auto embed(const std::vector<std::string>& texts, veclex::EmbedTask task, std::size_t dimension)
      -> std::expected<std::vector<std::vector<float>>, veclex::core::error> override {
    ++calls;
    last_task = task;
    last_texts = texts;
    if (failure) return std::unexpected(*failure);
    std::vector<std::vector<float>> rows;
    for (const auto& t : texts) {
      std::vector<float> v(override_dimension.value_or(dimension));
      for (std::size_t i = 0; i < v.size(); ++i) v[i] = static_cast<float>(t.size() + i + 1);
      rows.push_back(std::move(v));
    }
    return rows;
  }

  int calls{0};
  std::optional<veclex::EmbedTask> last_task;
  std::vector<std::string> last_texts;
  std::optional<veclex::core::error> failure;
  std::optional<std::size_t> override_dimension;
};

// Records every call and answers find_neighbors with canned neighbors.
class FakeSearchService final : public veclex::VectorSearchService {
public:
  auto upsert(const std::vector<veclex::index::IndexEntry>& entries)
      -> std::expected<void, veclex::core::error> override {
    if (failure) return std::unexpected(*failure);
    upserted.insert(upserted.end(), entries.begin(), entries.end());
    return {};
  }

  auto remove(const std::vector<std::string>& ids) -> std::expected<void, veclex::core::error> override {
    if (failure) return std::unexpected(*failure);
    removed.insert(removed.end(), ids.begin(), ids.end());
    return {};
  }

  auto update_from_prefix(const std::string& prefix, bool complete_overwrite)
      -> std::expected<void, veclex::core::error> override {
    if (failure) return std::unexpected(*failure);
    updated_prefix = prefix;
    overwrite = complete_overwrite;
    return {};
  }

  auto find_neighbors(const veclex::NeighborQuery& query)
      -> std::expected<std::vector<nlohmann::json>, veclex::core::error> override {
    last_query = query;
    if (failure) return std::unexpected(*failure);
    return neighbors;
  }

  std::vector<veclex::index::IndexEntry> upserted;
  std::vector<std::string> removed;
  std::optional<std::string> updated_prefix;
  bool overwrite{false};
  std::optional<veclex::NeighborQuery> last_query;
  std::vector<nlohmann::json> neighbors;
  std::optional<veclex::core::error> failure;
};

// Map-backed blob store that counts reads.
class MemoryBlobStore final : public veclex::io::BlobStore {
public:
  auto list(std::string_view prefix) const
      -> std::expected<std::vector<std::string>, veclex::core::error> override {
    auto key = veclex::io::to_object_key(prefix);
    if (!key) return std::unexpected(key.error());
    std::string dir = *key;
    while (!dir.empty() && dir.back() == '/') dir.pop_back();
    dir += '/';
    std::vector<std::string> names;
    for (const auto& [name, _] : objects) {
      if (name.rfind(dir, 0) == 0) names.push_back(name);
    }
    return names;
  }

  auto read(const std::string& name) const -> std::expected<std::string, veclex::core::error> override {
    ++reads;
    if (read_failure) return std::unexpected(*read_failure);
    auto key = veclex::io::to_object_key(name);
    if (!key) return std::unexpected(key.error());
    auto it = objects.find(*key);
    if (it == objects.end()) {
      return std::unexpected(veclex::core::error{veclex::core::error_code::not_found, "no object " + name, "test.blob"});
    }
    return it->second;
  }

  auto write(const std::string& name, std::string_view content) -> std::expected<void, veclex::core::error> override {
    auto key = veclex::io::to_object_key(name);
    if (!key) return std::unexpected(key.error());
    objects[*key] = std::string(content);
    return {};
  }

  std::map<std::string, std::string> objects;
  mutable std::size_t reads{0};
  std::optional<veclex::core::error> read_failure;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_, ec);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace test_support
