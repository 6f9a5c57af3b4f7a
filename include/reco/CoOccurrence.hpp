#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "menu/Catalog.hpp"
#include "orders/OrderParser.hpp"

namespace smartcart {

enum class SamplingStrategy {
    Uniform,   // seeded partial Fisher-Yates over order indices
    FirstN     // the first N orders in file order
};

const char* sampling_str(SamplingStrategy s);
bool parse_sampling(const std::string& s, SamplingStrategy& out);

struct CooccurrenceConfig {
    size_t sample_size = 0;    // 0 = every order
    SamplingStrategy sampling = SamplingStrategy::Uniform;
    uint64_t seed = 42;
    size_t shards = 1;         // 0 = one per hardware thread
};

// Unordered item pair: (min << 32) | max
using PairKey = uint64_t;

PairKey make_pair_key(ItemId a, ItemId b);
ItemId pair_first(PairKey k);
ItemId pair_second(PairKey k);

// Per-shard accumulator. Merging is key-wise addition, so shards can be
// counted independently and folded in any order.
struct PairCounts {
    std::unordered_map<PairKey, uint64_t> pairs;
    std::vector<uint64_t> totals;   // ItemId -> orders containing the item
    size_t orders_counted = 0;      // orders with at least one catalog item

    explicit PairCounts(size_t item_count = 0) : totals(item_count, 0) {}

    void add_order(const std::vector<ItemId>& distinct_sorted_items);
    void merge(const PairCounts& other);

    uint64_t count(ItemId a, ItemId b) const;
};

// Directed, sparse affinity: affinity(a, b) = count(a, b) / total(a).
// Rows are sorted by target id. Immutable once built.
class AffinityMatrix {
public:
    struct Entry {
        ItemId target = 0;
        double affinity = 0.0;
    };

    AffinityMatrix() = default;
    explicit AffinityMatrix(std::vector<std::vector<Entry>> rows);

    // 0.0 for unseen pairs and for a == b
    double affinity(ItemId a, ItemId b) const;

    const std::vector<Entry>& row(ItemId a) const;

    size_t item_count() const { return m_rows.size(); }
    size_t entry_count() const { return m_entries; }

private:
    std::vector<std::vector<Entry>> m_rows;
    size_t m_entries = 0;
};

struct BuildStats {
    size_t orders_available = 0;
    size_t orders_sampled = 0;
    size_t orders_with_items = 0;
    size_t distinct_pairs = 0;
    size_t shards = 0;
};

// Sorted indices of the orders to count. Same inputs -> same indices.
std::vector<size_t> sample_order_indices(size_t order_count, const CooccurrenceConfig& cfg);

// Count orders[indices[begin..end)] against the catalog. Names not in the
// catalog are ignored; repeated mentions within an order count once.
PairCounts count_pairs(
    const Catalog& catalog,
    const std::vector<Order>& orders,
    const std::vector<size_t>& indices,
    size_t begin,
    size_t end
);

// Sharded counting + merge over the sampled orders.
PairCounts count_all_pairs(
    const Catalog& catalog,
    const std::vector<Order>& orders,
    const CooccurrenceConfig& cfg,
    BuildStats* stats = nullptr
);

AffinityMatrix normalize_counts(const PairCounts& counts);

AffinityMatrix build_affinity_matrix(
    const Catalog& catalog,
    const std::vector<Order>& orders,
    const CooccurrenceConfig& cfg = {},
    BuildStats* stats = nullptr
);

}  // namespace smartcart
