#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace merlt {

// Provider keys and the model fallback chain, loaded from keys.json:
// {"keys": ["sk-..."], "primary": "model", "fallbacks": ["model", ...]}
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string primary_model;
    std::vector<std::string> fallback_models;

public:
    explicit KeyManager(const std::string& explicit_path = "") {
        refresh_key_pool(explicit_path);
    }

    void refresh_key_pool(const std::string& explicit_path = "") {
        std::vector<std::string> search_paths = {
            "keys.json",                // 1. Current Working Directory
            "../keys.json",             // 2. Parent Directory (common in build/)
            "config/keys.json",         // 3. Config Directory
            "build/keys.json",          // 4. Build Directory
            "../../keys.json"           // 5. Project Root (from build/bin)
        };
        if (!explicit_path.empty()) search_paths.insert(search_paths.begin(), explicit_path);

        std::ifstream f;
        std::string found_path = "";

        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
        }

        if (found_path.empty()) {
            spdlog::error("🚨 CRITICAL: Key Pool (keys.json) not found in any standard path!");
            return;
        }

        try {
            load_json(nlohmann::json::parse(f));
            spdlog::info("🛰️ Key vault loaded from {}", found_path);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse key vault {}: {}", found_path, e.what());
        }
    }

    void load_json(const nlohmann::json& j) {
        std::vector<ApiKey> keys;
        for (const auto& k : j.at("keys")) {
            keys.push_back({k.get<std::string>(), true, 0});
        }
        std::string primary = j.value("primary", "openai/gpt-4o-mini");
        std::vector<std::string> fallbacks = j.value("fallbacks", std::vector<std::string>{});

        std::unique_lock lock(pool_mutex);
        key_pool = std::move(keys);
        current_index = 0;
        primary_model = std::move(primary);
        fallback_models = std::move(fallbacks);
        spdlog::info("🔑 {} provider keys, model chain: {} (+{} fallbacks)",
                     key_pool.size(), primary_model, fallback_models.size());
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    // Skips decommissioned keys. Empty when no key is usable.
    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        for (size_t i = 0; i < key_pool.size(); ++i) {
            const auto& k = key_pool[(current_index + i) % key_pool.size()];
            if (k.is_active) return k.key;
        }
        return "";
    }

    std::vector<std::string> get_model_chain() const {
        std::shared_lock lock(pool_mutex);
        std::vector<std::string> chain;
        if (!primary_model.empty()) chain.push_back(primary_model);
        chain.insert(chain.end(), fallback_models.begin(), fallback_models.end());
        return chain;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} Decommissioned", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace merlt
