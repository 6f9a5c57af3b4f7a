#include "commands/build.hpp"

#include "menu/ItemTagger.hpp"
#include "orders/OrderTable.hpp"
#include "reco/CoOccurrence.hpp"
#include "reco/Snapshot.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static uint64_t get_arg_u64(int argc, char** argv, const std::string& key, uint64_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    if (s.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(key + " expects a non-negative integer, got: " + s);
    }
    try { return std::stoull(s); }
    catch (const std::exception&) { throw std::runtime_error(key + " value out of range: " + s); }
}

static int build_usage() {
    std::cerr
        << "usage:\n"
        << "  smartcart build --orders <csv> [options]\n"
        << "\n"
        << "options:\n"
        << "  --orders <path>              (required) order history CSV\n"
        << "  --orders_col <name>          default: ORDERS\n"
        << "  --sample <n>                 default: 0 (all orders)\n"
        << "  --sampling <uniform|first>   default: uniform\n"
        << "  --seed <n>                   default: 42\n"
        << "  --shards <n>                 default: 1 (0 = one per hardware thread)\n"
        << "  --out <path>                 default: artifacts/snapshot.json\n"
        << "  --quiet                      only print errors\n";
    return 1;
}

int cmd_build(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return build_usage();

    try {
        const fs::path orders_path = get_arg(argc, argv, "--orders", "");
        if (orders_path.empty()) {
            std::cerr << "error: missing --orders\n";
            return build_usage();
        }

        const fs::path out_path = get_arg(argc, argv, "--out", "artifacts/snapshot.json");
        const bool quiet = has_flag(argc, argv, "--quiet");

        smartcart::OrderTableConfig table_cfg;
        table_cfg.orders_column = get_arg(argc, argv, "--orders_col", table_cfg.orders_column);

        smartcart::CooccurrenceConfig co_cfg;
        co_cfg.sample_size = static_cast<size_t>(get_arg_u64(argc, argv, "--sample", co_cfg.sample_size));
        co_cfg.seed = get_arg_u64(argc, argv, "--seed", co_cfg.seed);
        co_cfg.shards = static_cast<size_t>(get_arg_u64(argc, argv, "--shards", co_cfg.shards));

        const std::string sampling = get_arg(argc, argv, "--sampling", "uniform");
        if (!smartcart::parse_sampling(sampling, co_cfg.sampling)) {
            throw std::runtime_error("--sampling must be 'uniform' or 'first', got: " + sampling);
        }

        const auto t0 = std::chrono::steady_clock::now();

        const smartcart::OrderTable table = smartcart::load_order_table(orders_path, table_cfg);
        const smartcart::Catalog catalog = smartcart::build_catalog(table.orders);

        smartcart::BuildStats stats;
        smartcart::AffinityMatrix matrix = smartcart::build_affinity_matrix(catalog, table.orders, co_cfg, &stats);

        smartcart::Snapshot snap;
        snap.info.snapshot_id = smartcart::snapshot_key(orders_path, co_cfg);
        snap.info.source = orders_path.string();
        snap.info.sample_size = co_cfg.sample_size;
        snap.info.sampling = co_cfg.sampling;
        snap.info.seed = co_cfg.seed;
        snap.info.orders_used = stats.orders_with_items;
        snap.info.distinct_pairs = stats.distinct_pairs;
        snap.catalog = catalog;
        snap.matrix = std::move(matrix);

        snap.write_to(out_path);

        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();

        if (!quiet) {
            std::cout << "ORDERS: " << orders_path.string() << "\n";
            std::cout << "ROWS: " << table.rows << "\n";
            std::cout << "EMPTY_ROWS: " << table.empty_rows << "\n";
            std::cout << "ITEMS: " << snap.catalog.size() << "\n";
            for (smartcart::Category c : smartcart::kAllCategories) {
                std::cout << "  " << smartcart::category_str(c) << ": " << snap.catalog.count_in(c) << "\n";
            }
            std::cout << "SAMPLING: " << smartcart::sampling_str(co_cfg.sampling)
                      << " (sample=" << co_cfg.sample_size << ", seed=" << co_cfg.seed << ")\n";
            std::cout << "ORDERS_SAMPLED: " << stats.orders_sampled << "\n";
            std::cout << "ORDERS_USED: " << stats.orders_with_items << "\n";
            std::cout << "SHARDS: " << stats.shards << "\n";
            std::cout << "PAIRS: " << stats.distinct_pairs << "\n";
            std::cout << "AFFINITY_ENTRIES: " << snap.matrix.entry_count() << "\n";
            std::cout << "SNAPSHOT_ID: " << snap.info.snapshot_id << "\n";
            std::cout << "OUT_SNAPSHOT: " << out_path.string() << "\n";
            std::cout << "ELAPSED_MS: " << ms << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "build failed: " << e.what() << "\n";
        return 1;
    }
}
