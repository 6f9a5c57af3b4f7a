#include "reco/BatchReport.hpp"

#include "io/CsvIO.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace smartcart {

static std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += v[i];
    }
    return out;
}

static std::string fmt_score(double x) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << x;
    return oss.str();
}

std::vector<std::string> BatchReport::csv_header() {
    return {
        "row_id", "cart",
        "rec1", "score1", "rec2", "score2", "rec3", "score3",
        "truth", "truth_hits", "truth_missed",
        "hit1", "hit2", "hit3", "hit_rank",
    };
}

void BatchReport::write_csv(std::ostream& out) const {
    write_csv_row(out, csv_header());

    for (const auto& r : result.rows) {
        std::vector<std::string> f;
        f.reserve(15);

        f.push_back(r.row_id);
        f.push_back(join(r.cart_input, " | "));

        for (size_t i = 0; i < kMaxCartItems; ++i) {
            if (i < r.recommendations.size()) {
                f.push_back(r.recommendations[i].name);
                f.push_back(fmt_score(r.recommendations[i].score));
            } else {
                f.push_back("");
                f.push_back("");
            }
        }

        f.push_back(join(r.truth, " | "));

        std::vector<std::string> missed;
        for (size_t t = 0; t < r.truth.size() && t < r.truth_found.size(); ++t) {
            if (!r.truth_found[t]) missed.push_back(r.truth[t]);
        }
        f.push_back(r.labeled() ? std::to_string(r.truth_hits) : "");
        f.push_back(join(missed, " | "));

        for (size_t i = 0; i < kMaxCartItems; ++i) {
            f.push_back(r.labeled() ? (r.slot_hit[i] ? "1" : "0") : "");
        }
        f.push_back(r.labeled() ? std::to_string(r.hit_rank) : "");

        write_csv_row(out, f);
    }
}

void BatchReport::write_csv_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path, std::ios::binary);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    write_csv(out);
    if (!out) throw std::runtime_error("Failed to write output file: " + out_path.string());
}

nlohmann::json BatchReport::metrics_json() const {
    const auto& m = result.metrics;

    nlohmann::json j;
    j["snapshot_id"] = snapshot_id;
    j["test_path"] = test_path;

    j["score_config"] = {
        {"aggregation", aggregation_str(score_cfg.aggregation)},
        {"category_bias", score_cfg.category_bias},
        {"top_k", score_cfg.top_k},
        {"fallback_enabled", score_cfg.fallback_enabled},
        {"extra_blacklist", score_cfg.extra_blacklist},
    };

    j["rows"] = m.rows;
    j["labeled_rows"] = m.labeled_rows;
    j["empty_cart_rows"] = m.empty_cart_rows;
    j["rows_with_hit"] = m.rows_with_hit;

    if (m.has_labels()) {
        j["recall_at_3"] = m.recall_at_3;
        j["precision_at_3"] = m.precision_at_3;
        j["top1_accuracy"] = m.top1_accuracy;
    } else {
        j["recall_at_3"] = nullptr;
        j["precision_at_3"] = nullptr;
        j["top1_accuracy"] = nullptr;
    }

    return j;
}

void BatchReport::write_metrics_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << metrics_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

}  // namespace smartcart
