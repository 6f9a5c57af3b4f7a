#include "commands/batch.hpp"

#include "orders/TestTable.hpp"
#include "reco/BatchReport.hpp"
#include "reco/Evaluator.hpp"
#include "reco/Snapshot.hpp"

#include <filesystem>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

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

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used == s.size() && std::isfinite(v)) return v;
    } catch (const std::exception&) {
    }
    throw std::runtime_error(key + " expects a finite number, got: " + s);
}

static std::vector<std::string> split_csv_list(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static int batch_usage() {
    std::cerr
        << "usage:\n"
        << "  smartcart batch --test <csv> [options]\n"
        << "\n"
        << "options:\n"
        << "  --snapshot <path>            default: artifacts/snapshot.json\n"
        << "  --test <path>                (required) test carts CSV\n"
        << "  --out <path>                 default: artifacts/recommendations.csv\n"
        << "  --metrics_out <path>         optional: write metrics JSON\n"
        << "  --cart_cols <a,b,c>          default: item1,item2,item3\n"
        << "  --truth_col <name>           default: truth (optional column)\n"
        << "  --id_col <name>              default: ORDER_ID (optional column)\n"
        << "  --bias <f>                   default: 0.15\n"
        << "  --aggregation <sum|mean>     default: sum\n"
        << "  --quiet                      only print errors\n";
    return 1;
}

int cmd_batch(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return batch_usage();

    try {
        const std::string test_path = get_arg(argc, argv, "--test", "");
        if (test_path.empty()) {
            std::cerr << "error: missing --test\n";
            return batch_usage();
        }

        const std::string snapshot_path = get_arg(argc, argv, "--snapshot", "artifacts/snapshot.json");
        const fs::path out_path = get_arg(argc, argv, "--out", "artifacts/recommendations.csv");
        const std::string metrics_out = get_arg(argc, argv, "--metrics_out", "");
        const bool quiet = has_flag(argc, argv, "--quiet");

        smartcart::TestTableConfig tcfg;
        const std::string cols = get_arg(argc, argv, "--cart_cols", "");
        if (!cols.empty()) tcfg.cart_columns = split_csv_list(cols);
        tcfg.truth_column = get_arg(argc, argv, "--truth_col", tcfg.truth_column);
        tcfg.id_column = get_arg(argc, argv, "--id_col", tcfg.id_column);

        smartcart::ScoreConfig cfg;
        cfg.category_bias = get_arg_double(argc, argv, "--bias", cfg.category_bias);
        smartcart::validate_score_config(cfg);
        const std::string agg = get_arg(argc, argv, "--aggregation", "sum");
        if (!smartcart::parse_aggregation(agg, cfg.aggregation)) {
            throw std::runtime_error("--aggregation must be 'sum' or 'mean', got: " + agg);
        }

        const smartcart::Snapshot snap = smartcart::Snapshot::load(snapshot_path);
        const smartcart::TestTable table = smartcart::load_test_table(test_path, tcfg);

        smartcart::BatchReport report;
        report.snapshot_id = snap.info.snapshot_id;
        report.test_path = test_path;
        report.score_cfg = cfg;
        report.result = smartcart::evaluate_batch(table.rows, snap.catalog, snap.matrix, cfg);

        report.write_csv_to(out_path);
        if (!metrics_out.empty()) report.write_metrics_to(metrics_out);

        if (!quiet) {
            const auto& m = report.result.metrics;
            std::cout << "SNAPSHOT_ID: " << snap.info.snapshot_id << "\n";
            std::cout << "TEST: " << test_path << "\n";
            std::cout << "ROWS: " << m.rows << "\n";
            std::cout << "EMPTY_CARTS: " << m.empty_cart_rows << "\n";
            if (table.truncated_carts > 0) std::cout << "TRUNCATED_CARTS: " << table.truncated_carts << "\n";
            std::cout << "LABELED_ROWS: " << m.labeled_rows << "\n";

            if (m.has_labels()) {
                std::cout << std::fixed << std::setprecision(4);
                std::cout << "RECALL@3: " << m.recall_at_3 << "\n";
                std::cout << "PRECISION@3: " << m.precision_at_3 << "\n";
                std::cout << "TOP1_ACCURACY: " << m.top1_accuracy << "\n";
            } else {
                std::cout << "METRICS: n/a (no ground-truth column)\n";
            }

            std::cout << "OUT_TABLE: " << out_path.string() << "\n";
            if (!metrics_out.empty()) std::cout << "OUT_METRICS: " << metrics_out << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "batch failed: " << e.what() << "\n";
        return 1;
    }
}
