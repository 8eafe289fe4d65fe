#include "veclex/service.hpp"

#include <fstream>
#include <iostream>

#include "veclex/core/platform_utils.hpp"
#include "veclex/io/jsonl.hpp"

namespace veclex {

auto JsonlRecordSource::fetch() -> std::expected<std::vector<Record>, core::error> {
    using core::error; using core::error_code;
    std::ifstream in(path_);
    if (!in.good()) {
        return std::unexpected(error{error_code::not_found,
            "record file open failed: " + path_.string(), "ingest.fetch"});
    }
    std::vector<Record> records;
    const auto stats = io::for_each_object(in, [&records](nlohmann::json&& item) {
        records.push_back(std::move(item));
        return true;
    });
    if (in.bad()) {
        return std::unexpected(error{error_code::io_failed,
            "record file read failed: " + path_.string(), "ingest.fetch"});
    }
    skipped_ = stats.skipped;
    if (core::debug_enabled()) {
        std::cerr << "[ingest] fetched records=" << records.size()
                  << " skipped=" << skipped_ << " from " << path_.string() << "\n";
    }
    return records;
}

} // namespace veclex
