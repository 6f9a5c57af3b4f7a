// include/reco/BatchReport.hpp
#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "reco/Evaluator.hpp"

namespace smartcart {

struct BatchReport {
    std::string snapshot_id;
    std::string test_path;
    ScoreConfig score_cfg;

    EvaluationResult result;

    // row_id,cart,rec1,score1,rec2,score2,rec3,score3,truth,truth_hits,truth_missed,
    // hit1,hit2,hit3,hit_rank
    // truth_hits counts recovered truth items; truth_missed lists the others
    static std::vector<std::string> csv_header();
    void write_csv(std::ostream& out) const;
    void write_csv_to(const std::filesystem::path& out_path) const;

    nlohmann::json metrics_json() const;
    void write_metrics_to(const std::filesystem::path& out_path) const;
};

}  // namespace smartcart
