#pragma once

#include <array>
#include <string>
#include <vector>

#include "menu/CartNormalizer.hpp"
#include "orders/TestTable.hpp"
#include "reco/Recommender.hpp"

namespace smartcart {

struct EvaluatedRow {
    std::string row_id;
    std::vector<std::string> cart_input;   // as read from the test table
    Cart cart;                             // after normalization
    std::vector<Recommendation> recommendations;
    std::vector<std::string> truth;        // deduplicated, as given
    std::vector<bool> truth_found;         // parallel to truth: recommended in the top 3

    // slot i (rank i+1) matched a ground-truth item
    std::array<bool, kMaxCartItems> slot_hit{};
    int hit_rank = 0;                      // best matching rank, 0 = miss
    size_t truth_hits = 0;                 // distinct truth items recovered

    double recall = 0.0;
    double precision = 0.0;
    bool top1 = false;

    bool labeled() const { return !truth.empty(); }
};

// Averages over labeled rows. Rows whose cart normalizes to nothing count
// with zero credit instead of being skipped.
struct EvaluationMetrics {
    size_t rows = 0;
    size_t labeled_rows = 0;
    size_t empty_cart_rows = 0;
    size_t rows_with_hit = 0;

    double recall_at_3 = 0.0;
    double precision_at_3 = 0.0;
    double top1_accuracy = 0.0;

    bool has_labels() const { return labeled_rows > 0; }
};

struct EvaluationResult {
    std::vector<EvaluatedRow> rows;
    EvaluationMetrics metrics;
};

EvaluatedRow evaluate_row(
    const TestRow& row,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg,
    const std::unordered_set<ItemId>& blacklist
);

EvaluationResult evaluate_batch(
    const std::vector<TestRow>& rows,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg = {}
);

}  // namespace smartcart
