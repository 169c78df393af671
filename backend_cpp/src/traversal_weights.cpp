#include "traversal_weights.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace merlt {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
// Keeps stored defaults strictly inside (0,1) so the logit stays finite.
constexpr double kWeightFloor = 0.01;
constexpr double kWeightCeil = 0.99;
}

double TraversalWeightStore::sigmoid(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

double TraversalWeightStore::logit(double p) {
    p = std::clamp(p, kWeightFloor, kWeightCeil);
    return std::log(p / (1.0 - p));
}

double TraversalSnapshot::weight(const std::string& relation) const {
    auto it = logits.find(relation);
    return TraversalWeightStore::sigmoid(it != logits.end() ? it->second : default_logit);
}

std::map<std::string, double> TraversalSnapshot::weights() const {
    std::map<std::string, double> out;
    for (const auto& [rel, l] : logits) out[rel] = TraversalWeightStore::sigmoid(l);
    return out;
}

TraversalWeightStore::TraversalWeightStore(const TraversalSettings& settings) : settings_(settings) {
    for (auto id : kAllExperts) {
        auto snap = std::make_shared<TraversalSnapshot>();
        snap->default_logit = logit(settings_.default_weight);
        auto it = settings_.defaults.find(id);
        if (it != settings_.defaults.end()) {
            for (const auto& [rel, w] : it->second) snap->logits[rel] = logit(w);
        }
        maps_[index_of(id)] = std::move(snap);
    }
}

std::shared_ptr<const TraversalSnapshot> TraversalWeightStore::snapshot(ExpertId expert) const {
    return std::atomic_load(&maps_[index_of(expert)]);
}

double TraversalWeightStore::weight(ExpertId expert, const std::string& relation) const {
    return snapshot(expert)->weight(relation);
}

std::map<std::string, double> TraversalWeightStore::weights(ExpertId expert) const {
    return snapshot(expert)->weights();
}

int TraversalWeightStore::update(ExpertId expert, const std::map<std::string, double>& logit_deltas) {
    if (logit_deltas.empty()) return 0;

    std::lock_guard<std::mutex> lock(writer_mutex_[index_of(expert)]);
    auto current = snapshot(expert);
    auto next = std::make_shared<TraversalSnapshot>(*current);

    int changed = 0;
    for (const auto& [rel, delta] : logit_deltas) {
        if (!std::isfinite(delta) || delta == 0.0) continue;
        auto it = next->logits.find(rel);
        double before = it != next->logits.end() ? it->second : next->default_logit;
        double after = std::clamp(before + delta, -settings_.max_logit, settings_.max_logit);
        if (after == before) continue;
        next->logits[rel] = after;
        ++changed;
        spdlog::debug("Traversal {}:{} {:.3f} -> {:.3f}", to_string(expert), rel, sigmoid(before), sigmoid(after));
    }
    if (changed == 0) return 0;

    next->version = current->version + 1;
    std::atomic_store(&maps_[index_of(expert)], std::shared_ptr<const TraversalSnapshot>(std::move(next)));
    return changed;
}

json TraversalWeightStore::to_json() const {
    json j = json::object();
    for (auto id : kAllExperts) {
        auto snap = snapshot(id);
        j[to_string(id)] = {
            {"version", snap->version},
            {"default_logit", snap->default_logit},
            {"logits", snap->logits}
        };
    }
    return j;
}

void TraversalWeightStore::load_json(const json& j) {
    for (auto id : kAllExperts) {
        if (!j.contains(to_string(id))) continue;
        const auto& e = j[to_string(id)];
        auto next = std::make_shared<TraversalSnapshot>();
        next->version = e.value("version", uint64_t{0});
        next->default_logit = e.value("default_logit", logit(settings_.default_weight));
        for (const auto& [rel, l] : e.at("logits").items()) {
            next->logits[rel] = std::clamp(l.get<double>(), -settings_.max_logit, settings_.max_logit);
        }
        std::lock_guard<std::mutex> lock(writer_mutex_[index_of(id)]);
        std::atomic_store(&maps_[index_of(id)], std::shared_ptr<const TraversalSnapshot>(std::move(next)));
    }
}

void TraversalWeightStore::save(const std::string& path) const {
    fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    std::ofstream out(p);
    if (!out.is_open()) throw std::runtime_error("cannot write traversal weights to " + path);
    out << to_json().dump(2);
    spdlog::info("💾 Traversal weights saved to {}", path);
}

bool TraversalWeightStore::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    try {
        load_json(json::parse(in));
        spdlog::info("✅ Traversal weights loaded from {}", path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("💥 Ignoring traversal weights in {}: {}", path, e.what());
        return false;
    }
}

} // namespace merlt
