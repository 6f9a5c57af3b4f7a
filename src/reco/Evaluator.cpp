#include "reco/Evaluator.hpp"
#include "orders/TextUtil.hpp"

#include <unordered_set>

namespace smartcart {

EvaluatedRow evaluate_row(
    const TestRow& row,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg,
    const std::unordered_set<ItemId>& blacklist
) {
    EvaluatedRow out;
    out.row_id = row.row_id;
    out.cart_input = row.cart;
    out.cart = normalize_cart(row.cart, catalog);
    out.recommendations = recommend(out.cart, catalog, matrix, cfg, blacklist);

    // truth compared by lookup key, so names outside the catalog simply never hit
    std::vector<std::string> truth_keys;
    std::unordered_set<std::string> seen;
    for (const auto& t : row.truth) {
        const std::string key = textutil::lookup_key(t);
        if (key.empty() || !seen.insert(key).second) continue;
        out.truth.push_back(t);
        truth_keys.push_back(key);
    }

    if (truth_keys.empty()) return out;

    std::vector<bool>& truth_found = out.truth_found;
    truth_found.assign(truth_keys.size(), false);
    size_t slot_hits = 0;

    for (size_t i = 0; i < out.recommendations.size() && i < kMaxCartItems; ++i) {
        const std::string rk = textutil::lookup_key(out.recommendations[i].name);
        for (size_t t = 0; t < truth_keys.size(); ++t) {
            if (truth_keys[t] != rk) continue;
            truth_found[t] = true;
            if (!out.slot_hit[i]) {
                out.slot_hit[i] = true;
                ++slot_hits;
                if (out.hit_rank == 0) out.hit_rank = static_cast<int>(i + 1);
            }
        }
    }

    for (bool f : truth_found) if (f) ++out.truth_hits;

    out.recall = static_cast<double>(out.truth_hits) / static_cast<double>(truth_keys.size());
    out.precision = static_cast<double>(slot_hits) / static_cast<double>(kMaxCartItems);
    out.top1 = out.slot_hit[0];
    return out;
}

EvaluationResult evaluate_batch(
    const std::vector<TestRow>& rows,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg
) {
    EvaluationResult res;
    res.rows.reserve(rows.size());

    const auto blacklist = resolve_blacklist(catalog, cfg);

    double recall_sum = 0.0;
    double precision_sum = 0.0;
    size_t top1_count = 0;

    for (const auto& row : rows) {
        EvaluatedRow er = evaluate_row(row, catalog, matrix, cfg, blacklist);

        res.metrics.rows += 1;
        if (er.cart.empty()) res.metrics.empty_cart_rows += 1;

        if (er.labeled()) {
            res.metrics.labeled_rows += 1;
            recall_sum += er.recall;
            precision_sum += er.precision;
            if (er.top1) ++top1_count;
            if (er.hit_rank > 0) res.metrics.rows_with_hit += 1;
        }

        res.rows.push_back(std::move(er));
    }

    if (res.metrics.labeled_rows > 0) {
        const double n = static_cast<double>(res.metrics.labeled_rows);
        res.metrics.recall_at_3 = recall_sum / n;
        res.metrics.precision_at_3 = precision_sum / n;
        res.metrics.top1_accuracy = static_cast<double>(top1_count) / n;
    }

    return res;
}

}  // namespace smartcart
