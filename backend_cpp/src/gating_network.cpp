#include "gating_network.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace merlt {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
constexpr double kLogitBound = 1e6;
constexpr double kMinPrior = 1e-6;
}

GatingNetwork::GatingNetwork(const GatingSettings& settings) : settings_(settings) {
    if (settings_.input_dim == 0) throw std::invalid_argument("gating input_dim must be positive");

    auto p = std::make_shared<GatingParameters>();
    p->input_dim = settings_.input_dim;
    for (auto& row : p->weights) row.assign(settings_.input_dim, 0.0);

    // Log-priors as bias: a zero embedding routes exactly to the configured priors.
    double total = 0.0;
    for (double v : settings_.priors) total += std::max(v, kMinPrior);
    for (size_t k = 0; k < kExpertCount; ++k) {
        p->bias[k] = std::log(std::max(settings_.priors[k], kMinPrior) / total);
    }
    params_ = std::move(p);

    spdlog::info("🧭 GatingNetwork ready (dim={}, priors literal={:.2f} systemic={:.2f} principles={:.2f} precedent={:.2f})",
                 settings_.input_dim, settings_.priors[0], settings_.priors[1],
                 settings_.priors[2], settings_.priors[3]);
}

std::shared_ptr<const GatingParameters> GatingNetwork::snapshot() const {
    return std::atomic_load(&params_);
}

void GatingNetwork::publish(std::shared_ptr<const GatingParameters> next) {
    std::atomic_store(&params_, std::move(next));
}

GatingWeights GatingNetwork::softmax(const std::array<double, kExpertCount>& logits) {
    std::array<double, kExpertCount> safe{};
    for (size_t k = 0; k < kExpertCount; ++k) {
        double l = std::isfinite(logits[k]) ? logits[k] : 0.0;
        safe[k] = std::clamp(l, -kLogitBound, kLogitBound);
    }
    double max_logit = *std::max_element(safe.begin(), safe.end());

    GatingWeights out{};
    double sum = 0.0;
    for (size_t k = 0; k < kExpertCount; ++k) {
        out[k] = std::exp(safe[k] - max_logit);
        sum += out[k];
    }
    // sum >= 1 because the max term contributes exp(0)
    for (auto& v : out) v /= sum;
    return out;
}

std::vector<double> GatingNetwork::sanitize(const std::vector<float>& query_embedding) const {
    if (query_embedding.size() != settings_.input_dim) {
        throw std::invalid_argument("query embedding has dimension " + std::to_string(query_embedding.size()) +
                                    ", gating network expects " + std::to_string(settings_.input_dim));
    }
    std::vector<double> x(query_embedding.size());
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = std::isfinite(query_embedding[i]) ? static_cast<double>(query_embedding[i]) : 0.0;
    }
    return x;
}

std::array<double, kExpertCount> GatingNetwork::logits(const GatingParameters& p, const std::vector<double>& x) const {
    std::array<double, kExpertCount> out{};
    for (size_t k = 0; k < kExpertCount; ++k) {
        out[k] = std::inner_product(p.weights[k].begin(), p.weights[k].end(), x.begin(), p.bias[k]);
    }
    return out;
}

GatingWeights GatingNetwork::route(const std::vector<float>& query_embedding) const {
    auto x = sanitize(query_embedding);
    auto p = snapshot();
    return softmax(logits(*p, x));
}

GatingWeights GatingNetwork::update(const std::vector<float>& query_embedding,
                                    const GatingWeights& target,
                                    double learning_rate_scale) {
    auto x = sanitize(query_embedding);

    GatingWeights t{};
    double t_sum = 0.0;
    for (size_t k = 0; k < kExpertCount; ++k) {
        if (!std::isfinite(target[k]) || target[k] < 0.0) {
            throw std::invalid_argument("gating target must be finite and non-negative");
        }
        t_sum += target[k];
    }
    if (t_sum <= 0.0) throw std::invalid_argument("gating target has zero mass");
    for (size_t k = 0; k < kExpertCount; ++k) t[k] = target[k] / t_sum;

    double step = settings_.learning_rate * std::clamp(learning_rate_scale, 0.0, 1.0);

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto current = snapshot();
    auto probs = softmax(logits(*current, x));

    if (step <= 0.0) return probs;

    auto next = std::make_shared<GatingParameters>(*current);
    for (size_t k = 0; k < kExpertCount; ++k) {
        // d(cross-entropy)/d(logit_k) = p_k - t_k
        double g = std::clamp(probs[k] - t[k], -settings_.gradient_clip, settings_.gradient_clip);
        if (g == 0.0) continue;
        auto& row = next->weights[k];
        for (size_t i = 0; i < row.size(); ++i) row[i] -= step * g * x[i];
        next->bias[k] -= step * g;
    }
    next->version = current->version + 1;
    next->updates = current->updates + 1;

    auto after = softmax(logits(*next, x));
    publish(std::move(next));

    spdlog::debug("Gating update v{}: literal {:.3f}->{:.3f}, systemic {:.3f}->{:.3f}, "
                  "principles {:.3f}->{:.3f}, precedent {:.3f}->{:.3f}",
                  current->version + 1, probs[0], after[0], probs[1], after[1],
                  probs[2], after[2], probs[3], after[3]);
    return after;
}

json GatingNetwork::to_json() const {
    auto p = snapshot();
    json rows = json::object();
    json bias = json::object();
    for (auto id : kAllExperts) {
        rows[to_string(id)] = p->weights[index_of(id)];
        bias[to_string(id)] = p->bias[index_of(id)];
    }
    return json{
        {"input_dim", p->input_dim},
        {"version", p->version},
        {"updates", p->updates},
        {"weights", rows},
        {"bias", bias}
    };
}

void GatingNetwork::load_json(const json& j) {
    size_t dim = j.at("input_dim").get<size_t>();
    if (dim != settings_.input_dim) {
        throw std::invalid_argument("stored gating parameters have dimension " + std::to_string(dim) +
                                    ", configured " + std::to_string(settings_.input_dim));
    }
    auto next = std::make_shared<GatingParameters>();
    next->input_dim = dim;
    next->version = j.value("version", uint64_t{0});
    next->updates = j.value("updates", uint64_t{0});
    for (auto id : kAllExperts) {
        auto row = j.at("weights").at(to_string(id)).get<std::vector<double>>();
        if (row.size() != dim) throw std::invalid_argument("gating row for " + to_string(id) + " has wrong size");
        next->weights[index_of(id)] = std::move(row);
        next->bias[index_of(id)] = j.at("bias").at(to_string(id)).get<double>();
    }

    std::lock_guard<std::mutex> lock(writer_mutex_);
    publish(std::move(next));
}

void GatingNetwork::save(const std::string& path) const {
    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p);
    if (!out.is_open()) throw std::runtime_error("cannot write gating parameters to " + path);
    out << to_json().dump();
    spdlog::info("💾 Gating parameters v{} saved to {}", version(), path);
}

bool GatingNetwork::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    try {
        load_json(json::parse(in));
        spdlog::info("✅ Gating parameters v{} loaded from {}", version(), path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("💥 Ignoring gating parameters in {}: {}", path, e.what());
        return false;
    }
}

} // namespace merlt
