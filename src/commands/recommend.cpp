#include "commands/recommend.hpp"

#include "menu/CartNormalizer.hpp"
#include "reco/Recommender.hpp"
#include "reco/Snapshot.hpp"

#include "nlohmann/json.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

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

// every value given for a repeatable flag, in order
static std::vector<std::string> get_args(int argc, char** argv, const std::string& key) {
    std::vector<std::string> out;
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) out.push_back(argv[++i]);
    }
    return out;
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

static int recommend_usage() {
    std::cerr
        << "usage:\n"
        << "  smartcart recommend --snapshot <path> --item <name> [--item <name> ...]\n"
        << "\n"
        << "options:\n"
        << "  --snapshot <path>            default: artifacts/snapshot.json\n"
        << "  --item <name>                cart item, up to 3, case-insensitive\n"
        << "  --bias <f>                   default: 0.15\n"
        << "  --aggregation <sum|mean>     default: sum\n"
        << "  --blacklist <name>           extra excluded item (repeatable)\n"
        << "  --no_fallback                do not fill slots from popularity\n"
        << "  --json                       print [{item, score, category}] as JSON\n";
    return 1;
}

int cmd_recommend(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return recommend_usage();

    const std::vector<std::string> items = get_args(argc, argv, "--item");
    if (items.empty()) {
        std::cerr << "error: missing --item\n";
        return recommend_usage();
    }
    if (items.size() > smartcart::kMaxCartItems) {
        std::cerr << "error: at most " << smartcart::kMaxCartItems << " --item values are allowed\n";
        return 2;
    }

    try {
        const std::string snapshot_path = get_arg(argc, argv, "--snapshot", "artifacts/snapshot.json");
        const bool as_json = has_flag(argc, argv, "--json");

        smartcart::ScoreConfig cfg;
        cfg.category_bias = get_arg_double(argc, argv, "--bias", cfg.category_bias);
        smartcart::validate_score_config(cfg);
        cfg.fallback_enabled = !has_flag(argc, argv, "--no_fallback");
        cfg.extra_blacklist = get_args(argc, argv, "--blacklist");

        const std::string agg = get_arg(argc, argv, "--aggregation", "sum");
        if (!smartcart::parse_aggregation(agg, cfg.aggregation)) {
            throw std::runtime_error("--aggregation must be 'sum' or 'mean', got: " + agg);
        }

        const smartcart::Snapshot snap = smartcart::Snapshot::load(snapshot_path);
        const smartcart::Cart cart = smartcart::normalize_cart(items, snap.catalog);
        const auto recs = smartcart::recommend(cart, snap.catalog, snap.matrix, cfg);

        if (as_json) {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& r : recs) {
                arr.push_back({
                    {"item", r.name},
                    {"score", r.score},
                    {"category", smartcart::category_str(r.category)},
                });
            }
            std::cout << arr.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return 0;
        }

        std::cout << "CART:";
        for (const auto& n : smartcart::cart_names(cart, snap.catalog)) std::cout << " [" << n << "]";
        std::cout << "\n";

        if (recs.empty()) {
            std::cout << "NO_RECOMMENDATION\n";
            return 0;
        }

        for (const auto& r : recs) {
            std::cout << r.rank << "  " << r.name
                      << "  " << std::fixed << std::setprecision(2) << r.score
                      << "  " << smartcart::category_str(r.category);
            if (r.source == smartcart::RecommendationSource::Fallback) std::cout << "  (fallback)";
            std::cout << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "recommend failed: " << e.what() << "\n";
        return 1;
    }
}
