#include "veclex/config/app_config.hpp"
#include "veclex/index/datapoint.hpp"
#include "veclex/index/sparse_encoder.hpp"
#include "veclex/io/blob_store.hpp"
#include "veclex/pipeline/ingest.hpp"
#include "veclex/search/neighbor.hpp"
#include "veclex/search/result_merger.hpp"
#include "veclex/service.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace {
struct Args {
    std::string command;
    std::string config;        // empty => VECLEX_CONFIG
    std::string records;
    std::string out_dir{"."};
    std::string prefix;
    std::optional<std::string> vector_field;
    std::optional<std::size_t> dimension;
    std::string text;
    std::int64_t buckets{30000};
    std::string file;
    std::string neighbors;
    std::string store_dir{"."};
    std::size_t parallelism{1};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "veclex: hybrid vector ingest and search tools\n"
              << "Usage: veclex <command> [--flag=value ...]\n"
              << "  embed        --records=file.jsonl --out_dir=path --prefix=gs://bucket/path\n"
              << "               [--config=config.json] [--vector_field=name] [--dimension=N]\n"
              << "  encode-query --text=\"query text\" [--buckets=30000]\n"
              << "  validate     --file=entries.jsonl\n"
              << "  merge        --neighbors=neighbors.json --store_dir=path --prefix=gs://bucket/path\n"
              << "               [--parallelism=1]\n"
              << "Set VECLEX_DEBUG=1 for stage diagnostics on stderr.\n";
}

static int fail(const veclex::core::error& e) {
    std::cerr << "error [" << veclex::core::to_string(e.code) << "] " << e.component << ": " << e.message << "\n";
    return 1;
}

static std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) return std::nullopt;
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

int run_embed(const Args& args) {
    if (args.records.empty()) { std::cerr << "embed: --records is required\n"; return 2; }
    auto cfg = args.config.empty() ? veclex::config::load_config() : veclex::config::load_config(args.config);
    if (!cfg) return fail(cfg.error());

    veclex::io::LocalBlobStore store(args.out_dir);
    veclex::JsonlRecordSource source(args.records);
    veclex::pipeline::IngestPipeline pipeline(*cfg, store);

    veclex::pipeline::EmbedOptions options;
    options.output_prefix = args.prefix;
    options.vector_field = args.vector_field;
    options.dimension = args.dimension;
    auto report = pipeline.embed_data(source, options);
    if (!report) return fail(report.error());

    nlohmann::json out = {
        {"status", "EMBEDDED"},
        {"output_prefix", report->output_prefix},
        {"output_file", report->output_file},
        {"row_count", report->row_count},
        {"sparse_entries", report->sparse_entries},
        {"skipped_records", report->skipped_records},
        {"skipped_values", report->skipped_values},
    };
    std::cout << out.dump(2) << "\n";
    return 0;
}

int run_encode_query(const Args& args) {
    veclex::index::SparseEncoderParams params;
    params.bucket_count = args.buckets;
    auto encoder = veclex::index::SparseEncoder::create(params);
    if (!encoder) return fail(encoder.error());
    std::cout << veclex::index::sparse_to_json(encoder->encode_query(args.text)).dump() << "\n";
    return 0;
}

int run_validate(const Args& args) {
    if (args.file.empty()) { std::cerr << "validate: --file is required\n"; return 2; }
    std::ifstream in(args.file);
    if (!in.good()) { std::cerr << "validate: cannot open " << args.file << "\n"; return 1; }

    std::size_t line_no = 0, valid = 0, invalid = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        auto entry = veclex::index::parse_line(line);
        if (entry) { ++valid; continue; }
        ++invalid;
        std::cerr << args.file << ":" << line_no << ": " << entry.error().message << "\n";
    }
    std::cout << "valid=" << valid << " invalid=" << invalid << "\n";
    return invalid == 0 ? 0 : 1;
}

int run_merge(const Args& args) {
    if (args.neighbors.empty() || args.prefix.empty()) {
        std::cerr << "merge: --neighbors and --prefix are required\n";
        return 2;
    }
    auto content = read_file(args.neighbors);
    if (!content) { std::cerr << "merge: cannot open " << args.neighbors << "\n"; return 1; }
    auto raw = nlohmann::json::parse(*content, nullptr, /*allow_exceptions=*/false);
    if (raw.is_discarded() || !raw.is_array()) {
        std::cerr << "merge: " << args.neighbors << " must hold a JSON array of neighbors\n";
        return 1;
    }

    auto results = veclex::search::normalize_neighbors(raw.get<std::vector<nlohmann::json>>());
    if (!results) return fail(results.error());

    veclex::io::LocalBlobStore store(args.store_dir);
    veclex::search::BackfillOptions options;
    options.parallelism = args.parallelism;
    veclex::search::MetadataBackfill backfill(store, args.prefix, options);
    auto stats = backfill.apply(*results);
    if (!stats) return fail(stats.error());

    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : *results) items.push_back(veclex::search::to_json(r));
    nlohmann::json out = {
        {"num_recommendations", results->size()},
        {"results", items},
        {"backfill", {{"requested", stats->requested}, {"found", stats->found},
                      {"blobs_scanned", stats->blobs_scanned}, {"skipped_lines", stats->skipped_lines}}},
    };
    std::cout << out.dump(2) << "\n";
    return 0;
}
}

int main(int argc, char** argv) {
    if (argc < 2) { print_usage(); return 2; }
    Args args;
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h") { print_usage(); return 0; }
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        try {
            if (a == "--help" || a == "-h") { print_usage(); return 0; }
            else if (auto v = eat(a, "--config=")) args.config = *v;
            else if (auto v = eat(a, "--records=")) args.records = *v;
            else if (auto v = eat(a, "--out_dir=")) args.out_dir = *v;
            else if (auto v = eat(a, "--prefix=")) args.prefix = *v;
            else if (auto v = eat(a, "--vector_field=")) args.vector_field = *v;
            else if (auto v = eat(a, "--dimension=")) args.dimension = static_cast<std::size_t>(std::stoull(*v));
            else if (auto v = eat(a, "--text=")) args.text = *v;
            else if (auto v = eat(a, "--buckets=")) args.buckets = std::stoll(*v);
            else if (auto v = eat(a, "--file=")) args.file = *v;
            else if (auto v = eat(a, "--neighbors=")) args.neighbors = *v;
            else if (auto v = eat(a, "--store_dir=")) args.store_dir = *v;
            else if (auto v = eat(a, "--parallelism=")) args.parallelism = static_cast<std::size_t>(std::stoull(*v));
            else { std::cerr << "Unknown argument: " << a << "\n"; print_usage(); return 2; }
        } catch (const std::exception& e) {
            std::cerr << "Bad value in " << a << ": " << e.what() << "\n";
            return 2;
        }
    }

    if (args.command == "embed") return run_embed(args);
    if (args.command == "encode-query") return run_encode_query(args);
    if (args.command == "validate") return run_validate(args);
    if (args.command == "merge") return run_merge(args);
    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage();
    return 2;
}
