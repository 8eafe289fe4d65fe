#pragma once

/** \file blob_store.hpp
 *  \brief Object storage abstraction for batch files and the metadata store.
 *
 * Object names are '/'-separated keys relative to the store. A prefix is
 * either a bare key prefix ("batch/run-1") or a bucket URI
 * ("gs://bucket/batch/run-1"); both resolve to the same key space layout
 * "<bucket>/<path>" in LocalBlobStore.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "veclex/error.hpp"

namespace veclex::io {

/** \brief Object storage collaborator. */
class BlobStore {
public:
    virtual ~BlobStore() = default;

    /** \brief Names of all objects under a prefix, sorted; empty if none. */
    [[nodiscard]] virtual auto list(std::string_view prefix) const
        -> std::expected<std::vector<std::string>, core::error> = 0;

    /** \brief Full content of one object; not_found if it does not exist. */
    [[nodiscard]] virtual auto read(const std::string& name) const
        -> std::expected<std::string, core::error> = 0;

    /** \brief Create or replace one object. */
    virtual auto write(const std::string& name, std::string_view content)
        -> std::expected<void, core::error> = 0;
};

/** \brief BlobStore backed by a directory tree. */
class LocalBlobStore final : public BlobStore {
public:
    explicit LocalBlobStore(std::filesystem::path root);

    [[nodiscard]] auto list(std::string_view prefix) const
        -> std::expected<std::vector<std::string>, core::error> override;
    [[nodiscard]] auto read(const std::string& name) const
        -> std::expected<std::string, core::error> override;
    auto write(const std::string& name, std::string_view content)
        -> std::expected<void, core::error> override;

    [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& { return root_; }

private:
    auto resolve(std::string_view name) const
        -> std::expected<std::filesystem::path, core::error>;

    std::filesystem::path root_;
};

/** \brief Bucket URI split into its parts. */
struct ObjectPrefix {
    std::string bucket;
    std::string path;   /**< without leading '/', trailing '/' preserved */
};

/** \brief Split "gs://bucket/path"; any other form is invalid_argument. */
auto parse_object_prefix(std::string_view uri) -> std::expected<ObjectPrefix, core::error>;

/** \brief Store key for a prefix: URIs become "<bucket>/<path>", bare keys lose leading '/'. */
auto to_object_key(std::string_view prefix) -> std::expected<std::string, core::error>;

/** \brief Append a leaf name to a prefix with exactly one '/' between them. */
auto join_object_name(std::string_view prefix, std::string_view leaf) -> std::string;

} // namespace veclex::io
