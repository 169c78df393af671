#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "config_manager.hpp"
#include "legal_types.hpp"

namespace merlt {

// One expert's relation preferences, stored as logits and exposed through a sigmoid.
struct TraversalSnapshot {
    std::map<std::string, double> logits;
    double default_logit = 0.0;
    uint64_t version = 0;

    double weight(const std::string& relation) const;
    std::map<std::string, double> weights() const;
};

// Four independent copy-on-write maps, one per expert. Readers load a snapshot
// without locking; each expert has its own writer mutex.
class TraversalWeightStore {
public:
    explicit TraversalWeightStore(const TraversalSettings& settings);

    std::shared_ptr<const TraversalSnapshot> snapshot(ExpertId expert) const;
    double weight(ExpertId expert, const std::string& relation) const;
    std::map<std::string, double> weights(ExpertId expert) const;
    uint64_t version(ExpertId expert) const { return snapshot(expert)->version; }

    // Adds `logit_deltas` to the expert's logits (clipped to +/- max_logit) and
    // publishes the result. Returns how many relations changed.
    int update(ExpertId expert, const std::map<std::string, double>& logit_deltas);

    nlohmann::json to_json() const;
    void load_json(const nlohmann::json& j);
    void save(const std::string& path) const;
    bool load(const std::string& path);

    static double sigmoid(double x);
    static double logit(double p);

private:
    TraversalSettings settings_;
    std::array<std::shared_ptr<const TraversalSnapshot>, kExpertCount> maps_;
    std::array<std::mutex, kExpertCount> writer_mutex_;
};

} // namespace merlt
