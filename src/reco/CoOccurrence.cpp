#include "reco/CoOccurrence.hpp"
#include "orders/TextUtil.hpp"

#include <algorithm>
#include <future>
#include <numeric>
#include <random>
#include <stdexcept>
#include <thread>

namespace smartcart {

static const std::vector<AffinityMatrix::Entry> kEmptyRow;

const char* sampling_str(SamplingStrategy s) {
    switch (s) {
        case SamplingStrategy::Uniform: return "uniform";
        case SamplingStrategy::FirstN: return "first";
        default: return "unknown";
    }
}

bool parse_sampling(const std::string& s, SamplingStrategy& out) {
    const std::string k = textutil::to_lower(textutil::trim(s));
    if (k == "uniform" || k == "random") { out = SamplingStrategy::Uniform; return true; }
    if (k == "first" || k == "firstn" || k == "head") { out = SamplingStrategy::FirstN; return true; }
    return false;
}

PairKey make_pair_key(ItemId a, ItemId b) {
    if (a > b) std::swap(a, b);
    return (static_cast<uint64_t>(a) << 32) | static_cast<uint64_t>(b);
}

ItemId pair_first(PairKey k) { return static_cast<ItemId>(k >> 32); }
ItemId pair_second(PairKey k) { return static_cast<ItemId>(k & 0xFFFFFFFFull); }

void PairCounts::add_order(const std::vector<ItemId>& items) {
    if (items.empty()) return;
    ++orders_counted;

    for (ItemId id : items) {
        if (id >= totals.size()) totals.resize(static_cast<size_t>(id) + 1, 0);
        totals[id] += 1;
    }

    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            pairs[make_pair_key(items[i], items[j])] += 1;
        }
    }
}

void PairCounts::merge(const PairCounts& other) {
    if (other.totals.size() > totals.size()) totals.resize(other.totals.size(), 0);
    for (size_t i = 0; i < other.totals.size(); ++i) totals[i] += other.totals[i];

    pairs.reserve(pairs.size() + other.pairs.size());
    for (const auto& kv : other.pairs) pairs[kv.first] += kv.second;

    orders_counted += other.orders_counted;
}

uint64_t PairCounts::count(ItemId a, ItemId b) const {
    if (a == b) return 0;
    auto it = pairs.find(make_pair_key(a, b));
    return it == pairs.end() ? 0 : it->second;
}

AffinityMatrix::AffinityMatrix(std::vector<std::vector<Entry>> rows) : m_rows(std::move(rows)) {
    for (auto& r : m_rows) {
        std::sort(r.begin(), r.end(), [](const Entry& x, const Entry& y) { return x.target < y.target; });
        m_entries += r.size();
    }
}

double AffinityMatrix::affinity(ItemId a, ItemId b) const {
    if (a == b || a >= m_rows.size()) return 0.0;
    const auto& r = m_rows[a];
    auto it = std::lower_bound(r.begin(), r.end(), b,
                               [](const Entry& e, ItemId t) { return e.target < t; });
    if (it == r.end() || it->target != b) return 0.0;
    return it->affinity;
}

const std::vector<AffinityMatrix::Entry>& AffinityMatrix::row(ItemId a) const {
    if (a >= m_rows.size()) return kEmptyRow;
    return m_rows[a];
}

std::vector<size_t> sample_order_indices(size_t order_count, const CooccurrenceConfig& cfg) {
    std::vector<size_t> idx(order_count);
    std::iota(idx.begin(), idx.end(), size_t{0});

    if (cfg.sample_size == 0 || cfg.sample_size >= order_count) return idx;

    if (cfg.sampling == SamplingStrategy::FirstN) {
        idx.resize(cfg.sample_size);
        return idx;
    }

    // mt19937_64 output is fixed by the standard; the modulo reduction keeps
    // the draw independent of the library's distribution implementation
    std::mt19937_64 rng(cfg.seed);
    for (size_t i = 0; i < cfg.sample_size; ++i) {
        const size_t span = order_count - i;
        const size_t j = i + static_cast<size_t>(rng() % span);
        std::swap(idx[i], idx[j]);
    }
    idx.resize(cfg.sample_size);
    std::sort(idx.begin(), idx.end());
    return idx;
}

PairCounts count_pairs(
    const Catalog& catalog,
    const std::vector<Order>& orders,
    const std::vector<size_t>& indices,
    size_t begin,
    size_t end
) {
    PairCounts counts(catalog.size());
    std::vector<ItemId> ids;

    end = std::min(end, indices.size());
    for (size_t k = begin; k < end; ++k) {
        const Order& order = orders.at(indices[k]);

        ids.clear();
        for (const auto& name : order) {
            auto id = catalog.find(name);
            if (id) ids.push_back(*id);
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

        counts.add_order(ids);
    }

    return counts;
}

static size_t resolve_shards(size_t requested, size_t work) {
    size_t n = requested;
    if (n == 0) {
        n = std::thread::hardware_concurrency();
        if (n == 0) n = 1;
    }
    if (work > 0) n = std::min(n, work);
    return std::max<size_t>(n, 1);
}

PairCounts count_all_pairs(
    const Catalog& catalog,
    const std::vector<Order>& orders,
    const CooccurrenceConfig& cfg,
    BuildStats* stats
) {
    const std::vector<size_t> indices = sample_order_indices(orders.size(), cfg);
    const size_t shards = resolve_shards(cfg.shards, indices.size());

    PairCounts merged(catalog.size());

    if (shards == 1) {
        merged = count_pairs(catalog, orders, indices, 0, indices.size());
    } else {
        const size_t per = (indices.size() + shards - 1) / shards;

        std::vector<std::future<PairCounts>> parts;
        parts.reserve(shards);
        for (size_t s = 0; s < shards; ++s) {
            const size_t b = s * per;
            const size_t e = std::min(indices.size(), b + per);
            parts.push_back(std::async(std::launch::async, [&catalog, &orders, &indices, b, e] {
                return count_pairs(catalog, orders, indices, b, e);
            }));
        }

        // merge is the only synchronization point; get() rethrows shard failures
        for (auto& f : parts) merged.merge(f.get());
    }

    if (stats) {
        stats->orders_available = orders.size();
        stats->orders_sampled = indices.size();
        stats->orders_with_items = merged.orders_counted;
        stats->distinct_pairs = merged.pairs.size();
        stats->shards = shards;
    }

    return merged;
}

AffinityMatrix normalize_counts(const PairCounts& counts) {
    std::vector<std::vector<AffinityMatrix::Entry>> rows(counts.totals.size());

    for (const auto& kv : counts.pairs) {
        const ItemId a = pair_first(kv.first);
        const ItemId b = pair_second(kv.first);

        if (a >= counts.totals.size() || b >= counts.totals.size() ||
            counts.totals[a] == 0 || counts.totals[b] == 0) {
            throw std::runtime_error("pair counted for an item with no recorded occurrences");
        }

        const double c = static_cast<double>(kv.second);
        rows[a].push_back({b, c / static_cast<double>(counts.totals[a])});
        rows[b].push_back({a, c / static_cast<double>(counts.totals[b])});
    }

    return AffinityMatrix(std::move(rows));
}

AffinityMatrix build_affinity_matrix(
    const Catalog& catalog,
    const std::vector<Order>& orders,
    const CooccurrenceConfig& cfg,
    BuildStats* stats
) {
    return normalize_counts(count_all_pairs(catalog, orders, cfg, stats));
}

}  // namespace smartcart
