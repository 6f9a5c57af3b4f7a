#include "reco/Snapshot.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace smartcart {

static const char* kFormat = "smartcart-snapshot";

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static const json& require_field(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    return j.at(key);
}

static const json& require_array(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    return v;
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!v.is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

static bool is_uint(const json& v) {
    if (!v.is_number_integer()) return false;
    return v.is_number_unsigned() || v.get<int64_t>() >= 0;
}

static uint64_t require_uint(const json& j, const char* key, const std::string& where) {
    const json& v = require_field(j, key, where);
    if (!is_uint(v)) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

static std::string indexed(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

// ---------- writing ----------

nlohmann::json Snapshot::to_json() const {
    json j;
    j["format"] = kFormat;
    j["version"] = kSnapshotVersion;

    j["info"] = {
        {"snapshot_id", info.snapshot_id},
        {"source", info.source},
        {"sample_size", info.sample_size},
        {"sampling", sampling_str(info.sampling)},
        {"seed", info.seed},
        {"orders_used", info.orders_used},
        {"distinct_pairs", info.distinct_pairs},
    };

    json items = json::array();
    for (const auto& it : catalog.items()) {
        items.push_back({
            {"name", it.name},
            {"category", category_str(it.category)},
            {"attributes", attribute_names(it.attributes)},
            {"frequency", it.frequency},
        });
    }
    j["items"] = items;

    json top = json::object();
    for (Category c : kAllCategories) top[category_str(c)] = catalog.top_by_category(c);
    j["top_by_category"] = top;

    json rows = json::array();
    for (size_t a = 0; a < matrix.item_count(); ++a) {
        const auto& r = matrix.row(static_cast<ItemId>(a));
        if (r.empty()) continue;

        json targets = json::array();
        for (const auto& e : r) targets.push_back(json::array({e.target, e.affinity}));
        rows.push_back({{"source", a}, {"targets", targets}});
    }
    j["affinity"] = rows;

    return j;
}

void Snapshot::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    // item names come from raw CSV text; never fail the dump on bad UTF-8
    out << to_json().dump(1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out) throw std::runtime_error("Failed to write snapshot: " + out_path.string());
}

// ---------- reading ----------

static Item parse_item(const json& j, const std::string& where) {
    require_object(j, where);

    Item it;
    it.name = require_string(j, "name", where);

    const std::string cat = require_string(j, "category", where);
    if (!parse_category(cat, it.category)) {
        throw std::runtime_error(where + ".category has unknown value: " + cat);
    }

    const json& attrs = require_array(j, "attributes", where);
    for (size_t i = 0; i < attrs.size(); ++i) {
        Attribute a;
        if (!attrs[i].is_string() || !parse_attribute(attrs[i].get<std::string>(), a)) {
            throw std::runtime_error(indexed(where + ".attributes", i) + " is not a known attribute");
        }
        it.attributes |= a;
    }

    it.frequency = require_uint(j, "frequency", where);
    return it;
}

static void check_rankings(const json& j, const Catalog& catalog) {
    require_object(j, "root.top_by_category");

    for (Category c : kAllCategories) {
        const std::string where = std::string("root.top_by_category.") + category_str(c);
        const json& arr = require_array(j, category_str(c), "root.top_by_category");

        const auto& expected = catalog.top_by_category(c);
        if (arr.size() != expected.size()) {
            throw std::runtime_error(where + " does not match the catalog");
        }
        for (size_t i = 0; i < arr.size(); ++i) {
            if (!is_uint(arr[i]) || arr[i].get<uint64_t>() != expected[i]) {
                throw std::runtime_error(where + " does not match the catalog");
            }
        }
    }
}

static AffinityMatrix parse_matrix(const json& rows, size_t item_count) {
    std::vector<std::vector<AffinityMatrix::Entry>> out(item_count);

    for (size_t r = 0; r < rows.size(); ++r) {
        const std::string where = indexed("root.affinity", r);
        require_object(rows[r], where);

        const uint64_t src = require_uint(rows[r], "source", where);
        if (src >= item_count) throw std::runtime_error(where + ".source out of range");
        if (!out[src].empty()) throw std::runtime_error(where + ".source appears twice");

        const json& targets = require_array(rows[r], "targets", where);
        if (targets.empty()) throw std::runtime_error(where + ".targets is empty");

        auto& row = out[src];
        row.reserve(targets.size());

        for (size_t t = 0; t < targets.size(); ++t) {
            const json& e = targets[t];
            const std::string ew = indexed(where + ".targets", t);

            if (!e.is_array() || e.size() != 2 || !is_uint(e[0]) || !e[1].is_number()) {
                throw std::runtime_error(ew + " must be [target, affinity]");
            }

            const uint64_t dst = e[0].get<uint64_t>();
            const double aff = e[1].get<double>();

            if (dst >= item_count) throw std::runtime_error(ew + " target out of range");
            if (dst == src) throw std::runtime_error(ew + " is a self pair");
            if (!row.empty() && dst <= row.back().target) throw std::runtime_error(ew + " targets not ascending");
            if (!std::isfinite(aff) || aff < 0.0 || aff > 1.0) throw std::runtime_error(ew + " affinity outside [0,1]");

            row.push_back({static_cast<ItemId>(dst), aff});
        }
    }

    return AffinityMatrix(std::move(out));
}

Snapshot Snapshot::from_json(const json& j) {
    require_object(j, "root");

    if (require_string(j, "format", "root") != kFormat) {
        throw std::runtime_error("root.format is not " + std::string(kFormat));
    }
    if (require_uint(j, "version", "root") != static_cast<uint64_t>(kSnapshotVersion)) {
        throw std::runtime_error("unsupported snapshot version");
    }

    Snapshot s;

    const json& info = require_field(j, "info", "root");
    require_object(info, "root.info");
    s.info.snapshot_id = require_string(info, "snapshot_id", "root.info");
    s.info.source = require_string(info, "source", "root.info");
    s.info.sample_size = static_cast<size_t>(require_uint(info, "sample_size", "root.info"));
    const std::string sampling = require_string(info, "sampling", "root.info");
    if (!parse_sampling(sampling, s.info.sampling)) {
        throw std::runtime_error("root.info.sampling has unknown value: " + sampling);
    }
    s.info.seed = require_uint(info, "seed", "root.info");
    s.info.orders_used = static_cast<size_t>(require_uint(info, "orders_used", "root.info"));
    s.info.distinct_pairs = static_cast<size_t>(require_uint(info, "distinct_pairs", "root.info"));

    const json& items_j = require_array(j, "items", "root");
    std::vector<Item> items;
    items.reserve(items_j.size());
    for (size_t i = 0; i < items_j.size(); ++i) {
        items.push_back(parse_item(items_j[i], indexed("root.items", i)));
    }
    s.catalog = Catalog(std::move(items));

    check_rankings(require_field(j, "top_by_category", "root"), s.catalog);

    s.matrix = parse_matrix(require_array(j, "affinity", "root"), s.catalog.size());
    return s;
}

Snapshot Snapshot::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open snapshot file: " + path.string());
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse snapshot JSON: ") + e.what());
    }

    return from_json(j);
}

// ---------- key ----------

static uint64_t fnv1a64_update(uint64_t h, const char* data, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        h ^= (uint64_t)(unsigned char)data[i];
        h *= 1099511628211ull;
    }
    return h;
}

static std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

std::string snapshot_key(const std::filesystem::path& orders_path, const CooccurrenceConfig& cfg) {
    std::ifstream in(orders_path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + orders_path.string());

    uint64_t h = 1469598103934665603ull;
    char buf[1 << 16];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        h = fnv1a64_update(h, buf, static_cast<size_t>(in.gcount()));
    }

    std::ostringstream params;
    params << "\n" << cfg.sample_size << "\n" << sampling_str(cfg.sampling) << "\n" << cfg.seed;
    const std::string p = params.str();
    h = fnv1a64_update(h, p.data(), p.size());

    return hex_u64(h);
}

}  // namespace smartcart
