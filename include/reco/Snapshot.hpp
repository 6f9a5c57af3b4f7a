// include/reco/Snapshot.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "menu/Catalog.hpp"
#include "nlohmann/json.hpp"
#include "reco/CoOccurrence.hpp"

namespace smartcart {

constexpr int kSnapshotVersion = 1;

struct SnapshotInfo {
    std::string snapshot_id;   // dataset + sampling digest
    std::string source;        // orders file the snapshot was built from
    size_t sample_size = 0;
    SamplingStrategy sampling = SamplingStrategy::Uniform;
    uint64_t seed = 0;
    size_t orders_used = 0;
    size_t distinct_pairs = 0;
};

// Everything the scorer needs for one dataset snapshot: catalog with tags
// and rankings, plus the affinity matrix. Built once, then only read.
struct Snapshot {
    SnapshotInfo info;
    Catalog catalog;
    AffinityMatrix matrix;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;

    // Throws std::runtime_error on any structural problem.
    static Snapshot from_json(const nlohmann::json& j);
    static Snapshot load(const std::filesystem::path& path);
};

// FNV-1a over the orders file bytes and the sampling parameters.
std::string snapshot_key(const std::filesystem::path& orders_path, const CooccurrenceConfig& cfg);

}  // namespace smartcart
