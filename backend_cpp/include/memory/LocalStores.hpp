#pragma once
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "collaborators.hpp"

namespace merlt {

// Process-local idempotence store. Deployments with more than one daemon
// should back IdempotenceStore with the shared database instead.
class InMemoryIdempotenceStore : public IdempotenceStore {
public:
    bool has_processed(const std::string& feedback_id) override {
        std::lock_guard<std::mutex> lock(mtx_);
        return processed_.count(feedback_id) > 0;
    }

    void mark_processed(const std::string& feedback_id) override {
        std::lock_guard<std::mutex> lock(mtx_);
        processed_.insert(feedback_id);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return processed_.size();
    }

private:
    std::unordered_set<std::string> processed_;
    mutable std::mutex mtx_;
};

// User profiles read from a users.json export of the community database:
// {"users": [{"user_id": "...", "role": "avvocato", "accuracy": 0.8, ...}]}
class JsonUserStore : public UserStore {
public:
    JsonUserStore() = default;
    explicit JsonUserStore(const std::string& path) { load(path); }

    bool load(const std::string& path) {
        std::ifstream f(path);
        if (!f.is_open()) {
            spdlog::warn("⚠️ User export {} not found, authority lookups will reject every user", path);
            return false;
        }
        try {
            auto j = nlohmann::json::parse(f);
            std::unique_lock lock(mtx_);
            users_.clear();
            for (const auto& u : j.value("users", nlohmann::json::array())) {
                UserProfile p;
                p.user_id = u.value("user_id", "");
                p.role = u.value("role", "");
                p.history.accuracy = u.value("accuracy", 0.5);
                p.history.consensus = u.value("consensus", 0.5);
                p.history.reputation = u.value("reputation", 0.5);
                p.history.feedback_count = u.value("feedback_count", 0);
                if (!p.user_id.empty()) users_[p.user_id] = p;
            }
            spdlog::info("👥 Loaded {} user profiles from {}", users_.size(), path);
            return true;
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse user export {}: {}", path, e.what());
            return false;
        }
    }

    void upsert(const UserProfile& profile) {
        std::unique_lock lock(mtx_);
        users_[profile.user_id] = profile;
    }

    std::optional<UserProfile> get_user_profile(const std::string& user_id) override {
        std::shared_lock lock(mtx_);
        auto it = users_.find(user_id);
        if (it == users_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::unordered_map<std::string, UserProfile> users_;
    mutable std::shared_mutex mtx_;
};

} // namespace merlt
