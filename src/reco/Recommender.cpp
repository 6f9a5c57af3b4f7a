#include "reco/Recommender.hpp"
#include "orders/TextUtil.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <unordered_map>

namespace smartcart {

const char* aggregation_str(Aggregation a) {
    switch (a) {
        case Aggregation::Sum: return "sum";
        case Aggregation::Mean: return "mean";
        default: return "unknown";
    }
}

bool parse_aggregation(const std::string& s, Aggregation& out) {
    const std::string k = textutil::to_lower(textutil::trim(s));
    if (k == "sum") { out = Aggregation::Sum; return true; }
    if (k == "mean" || k == "avg" || k == "average") { out = Aggregation::Mean; return true; }
    return false;
}

const char* source_str(RecommendationSource s) {
    switch (s) {
        case RecommendationSource::Affinity: return "affinity";
        case RecommendationSource::Fallback: return "fallback";
        default: return "unknown";
    }
}

void validate_score_config(const ScoreConfig& cfg) {
    // a NaN score would break the ordering used to rank candidates
    if (!std::isfinite(cfg.category_bias)) {
        throw std::runtime_error("category_bias must be a finite number");
    }
    if (cfg.category_bias < 0.0) {
        throw std::runtime_error("category_bias must be >= 0");
    }
}

const std::vector<std::string>& default_blacklist() {
    static const std::vector<std::string> names = {
        "delivery fee", "service fee", "small order fee", "bag fee", "bag",
        "paper bag", "tip", "gratuity", "utensils", "napkins", "extra plates",
        "plates", "open food", "custom item", "special instructions", "gift card",
        "donation", "coupon", "discount", "promo", "catering setup", "no sauce",
        "no dip", "extra sauce cup",
    };
    return names;
}

std::unordered_set<ItemId> resolve_blacklist(const Catalog& catalog, const ScoreConfig& cfg) {
    std::unordered_set<ItemId> out;
    for (const auto& n : default_blacklist()) {
        if (auto id = catalog.find(n)) out.insert(*id);
    }
    for (const auto& n : cfg.extra_blacklist) {
        if (auto id = catalog.find(n)) out.insert(*id);
    }
    return out;
}

std::vector<Recommendation> recommend(
    const Cart& cart,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg
) {
    return recommend(cart, catalog, matrix, cfg, resolve_blacklist(catalog, cfg));
}

static bool eligible(
    ItemId id,
    const Cart& cart,
    const std::unordered_set<ItemId>& blacklist,
    const std::vector<Recommendation>& picked
) {
    if (cart.contains(id)) return false;
    if (blacklist.count(id)) return false;
    for (const auto& r : picked) if (r.item == id) return false;
    return true;
}

std::vector<Recommendation> recommend(
    const Cart& cart,
    const Catalog& catalog,
    const AffinityMatrix& matrix,
    const ScoreConfig& cfg,
    const std::unordered_set<ItemId>& blacklist
) {
    validate_score_config(cfg);
    if (cart.empty() || catalog.empty()) return {};

    const size_t k = std::min<size_t>(cfg.top_k, kMaxCartItems);
    if (k == 0) return {};

    std::array<bool, kCategoryCount> covered{};
    for (ItemId id : cart.items) covered[category_index(catalog.item(id).category)] = true;

    // 1) base scores from the sparse rows of each cart item
    std::unordered_map<ItemId, double> base;
    base.reserve(64);
    for (ItemId a : cart.items) {
        for (const auto& e : matrix.row(a)) {
            if (e.target >= catalog.size()) continue;
            base[e.target] += e.affinity;
        }
    }

    const double denom = (cfg.aggregation == Aggregation::Mean) ? static_cast<double>(cart.size()) : 1.0;

    std::vector<Recommendation> candidates;
    candidates.reserve(base.size());

    for (const auto& kv : base) {
        const ItemId id = kv.first;

        // 2) blacklist + already in cart
        if (cart.contains(id) || blacklist.count(id)) continue;

        const double b = kv.second / denom;
        if (b <= 0.0) continue;

        const Item& item = catalog.item(id);

        // 3) soft bias towards categories the cart lacks
        Recommendation r;
        r.item = id;
        r.name = item.name;
        r.category = item.category;
        r.breakdown.base = b;
        r.breakdown.bias = covered[category_index(item.category)] ? 0.0 : cfg.category_bias;
        r.breakdown.total = r.breakdown.base + r.breakdown.bias;
        r.score = r.breakdown.total;
        r.source = RecommendationSource::Affinity;
        candidates.push_back(std::move(r));
    }

    // 5) score desc, then popularity desc, then catalog order
    std::sort(candidates.begin(), candidates.end(),
              [&catalog](const Recommendation& x, const Recommendation& y) {
                  if (x.score != y.score) return x.score > y.score;
                  const uint64_t fx = catalog.item(x.item).frequency;
                  const uint64_t fy = catalog.item(y.item).frequency;
                  if (fx != fy) return fx > fy;
                  return x.item < y.item;
              });

    if (candidates.size() > k) candidates.resize(k);
    std::vector<Recommendation> picked = std::move(candidates);

    // 4) fallback: cycle categories, unrepresented ones first
    if (picked.size() < k && cfg.fallback_enabled) {
        std::array<bool, kCategoryCount> represented = covered;
        for (const auto& r : picked) represented[category_index(r.category)] = true;

        std::vector<Category> cycle;
        for (Category c : kAllCategories) if (!represented[category_index(c)]) cycle.push_back(c);
        for (Category c : kAllCategories) if (represented[category_index(c)]) cycle.push_back(c);

        std::array<size_t, kCategoryCount> cursor{};

        bool progress = true;
        while (picked.size() < k && progress) {
            progress = false;
            for (Category c : cycle) {
                if (picked.size() >= k) break;

                const auto& ranked = catalog.top_by_category(c);
                size_t& pos = cursor[category_index(c)];
                while (pos < ranked.size() && !eligible(ranked[pos], cart, blacklist, picked)) ++pos;
                if (pos >= ranked.size()) continue;

                const Item& item = catalog.item(ranked[pos]);
                Recommendation r;
                r.item = ranked[pos];
                r.name = item.name;
                r.category = item.category;
                r.score = 0.0;
                r.source = RecommendationSource::Fallback;
                picked.push_back(std::move(r));

                ++pos;
                progress = true;
            }
        }
    }

    for (size_t i = 0; i < picked.size(); ++i) picked[i].rank = static_cast<int>(i + 1);
    return picked;
}

}  // namespace smartcart
