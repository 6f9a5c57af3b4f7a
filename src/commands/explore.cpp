#include "commands/explore.hpp"

#include "reco/Snapshot.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

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

static int explore_usage() {
    std::cerr
        << "usage:\n"
        << "  smartcart explore [--snapshot <path>] [--top <n>]\n"
        << "\n"
        << "options:\n"
        << "  --snapshot <path>            default: artifacts/snapshot.json\n"
        << "  --top <n>                    default: 10 items per category\n";
    return 1;
}

int cmd_explore(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return explore_usage();

    try {
        const std::string snapshot_path = get_arg(argc, argv, "--snapshot", "artifacts/snapshot.json");

        const std::string top_s = get_arg(argc, argv, "--top", "10");
        if (top_s.empty() || top_s.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("--top expects a non-negative integer, got: " + top_s);
        }
        const size_t top = static_cast<size_t>(std::stoul(top_s));

        const smartcart::Snapshot snap = smartcart::Snapshot::load(snapshot_path);
        const auto& catalog = snap.catalog;

        std::cout << "SNAPSHOT_ID: " << snap.info.snapshot_id << "\n";
        std::cout << "SOURCE: " << snap.info.source << "\n";
        std::cout << "ORDERS_USED: " << snap.info.orders_used << "\n";
        std::cout << "ITEMS: " << catalog.size() << "\n";
        std::cout << "AFFINITY_ENTRIES: " << snap.matrix.entry_count() << "\n";

        for (smartcart::Category c : smartcart::kAllCategories) {
            const auto& ranked = catalog.top_by_category(c);
            std::cout << "\n" << smartcart::category_str(c) << " (" << ranked.size() << ")\n";

            for (size_t i = 0; i < ranked.size() && i < top; ++i) {
                const auto& it = catalog.item(ranked[i]);
                std::cout << "  " << (i + 1) << ". " << it.name << " - " << it.frequency;

                const auto attrs = smartcart::attribute_names(it.attributes);
                if (!attrs.empty()) {
                    std::cout << "  [";
                    for (size_t a = 0; a < attrs.size(); ++a) std::cout << (a ? "," : "") << attrs[a];
                    std::cout << "]";
                }
                std::cout << "\n";
            }
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "explore failed: " << e.what() << "\n";
        return 1;
    }
}
