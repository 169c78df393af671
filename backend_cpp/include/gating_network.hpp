#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config_manager.hpp"
#include "legal_types.hpp"

namespace merlt {

// Immutable parameter set. A new instance is published on every update.
struct GatingParameters {
    size_t input_dim = 0;
    std::array<std::vector<double>, kExpertCount> weights;   // one row of input_dim per expert
    std::array<double, kExpertCount> bias{};
    uint64_t version = 0;
    uint64_t updates = 0;
};

/**
 * Mixture-of-experts gate: softmax(W·x + b) over the four experts.
 *
 * Readers never lock: route() loads the current shared_ptr snapshot and works on it.
 * update() is the only mutation path. It copies the live parameters, applies one
 * cross-entropy gradient step and publishes the copy atomically, so a concurrent
 * reader sees either the old or the new parameter set.
 */
class GatingNetwork {
public:
    explicit GatingNetwork(const GatingSettings& settings);

    GatingWeights route(const std::vector<float>& query_embedding) const;

    // Moves the output for `query_embedding` towards `target` (any non-negative vector,
    // normalised here). Step size = learning_rate * learning_rate_scale.
    // Returns the distribution after the update.
    GatingWeights update(const std::vector<float>& query_embedding,
                         const GatingWeights& target,
                         double learning_rate_scale);

    std::shared_ptr<const GatingParameters> snapshot() const;
    uint64_t version() const { return snapshot()->version; }
    size_t input_dim() const { return settings_.input_dim; }

    nlohmann::json to_json() const;
    // Replaces the live parameters. Throws std::invalid_argument on shape mismatch.
    void load_json(const nlohmann::json& j);
    void save(const std::string& path) const;
    bool load(const std::string& path);

    static GatingWeights softmax(const std::array<double, kExpertCount>& logits);

private:
    std::array<double, kExpertCount> logits(const GatingParameters& p, const std::vector<double>& x) const;
    std::vector<double> sanitize(const std::vector<float>& query_embedding) const;
    void publish(std::shared_ptr<const GatingParameters> next);

    GatingSettings settings_;
    std::shared_ptr<const GatingParameters> params_;
    std::mutex writer_mutex_;
};

} // namespace merlt
