#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "menu/CartNormalizer.hpp"
#include "menu/Catalog.hpp"
#include "reco/CoOccurrence.hpp"

namespace smartcart {

enum class Aggregation {
    Sum,   // base = sum over cart items of affinity(cart_item, candidate)
    Mean   // base = that sum / cart size
};

const char* aggregation_str(Aggregation a);
bool parse_aggregation(const std::string& s, Aggregation& out);

enum class RecommendationSource {
    Affinity,
    Fallback
};

const char* source_str(RecommendationSource s);

struct ScoreConfig {
    Aggregation aggregation = Aggregation::Sum;

    // Added to candidates whose category is not in the cart yet.
    // Must stay > 0 for the diversity tie-break to be observable.
    double category_bias = 0.15;

    // never more than 3
    size_t top_k = 3;

    // fill empty slots from per-category popularity
    bool fallback_enabled = true;

    // added on top of default_blacklist(), matched case-insensitively
    std::vector<std::string> extra_blacklist;
};

struct ScoreBreakdown {
    double base = 0.0;   // aggregated affinity
    double bias = 0.0;   // category_bias or 0
    double total = 0.0;  // base + bias; 0 for fallback picks
};

struct Recommendation {
    ItemId item = 0;
    std::string name;
    Category category = Category::Other;
    int rank = 0;  // 1..3
    double score = 0.0;
    ScoreBreakdown breakdown;
    RecommendationSource source = RecommendationSource::Affinity;
};

// Throws std::runtime_error unless category_bias is finite and >= 0.
void validate_score_config(const ScoreConfig& cfg);

// Non-food placeholder entries that are never recommended.
const std::vector<std::string>& default_blacklist();

std::unordered_set<ItemId> resolve_blacklist(const Catalog& catalog, const ScoreConfig& cfg);

// Top-k (k <= 3) complements for the cart. Empty only when the cart is empty
// or nothing in the catalog is eligible. Pure; safe to call concurrently on
// shared catalog and matrix. Throws if cfg fails validate_score_config.
std::vector<Recommendation> recommend(
    const Cart& cart,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg = {}
);

// Same, with a blacklist resolved up front (batch scoring reuses it).
std::vector<Recommendation> recommend(
    const Cart& cart,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg,
    const std::unordered_set<ItemId>& blacklist
);

}  // namespace smartcart
