#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <nlohmann/json.hpp>
#include "cache_manager.hpp"
#include "collaborators.hpp"
#include "config_manager.hpp"
#include "KeyManager.hpp"

namespace merlt {

std::string utf8_safe_substr(const std::string& str, size_t length);

// Pulls the JSON payload out of a model reply: a ```json fence, else the outermost braces.
// Empty when there is none.
std::string extract_json_payload(const std::string& raw);

// OpenAI-compatible chat and embedding endpoints over cpr. Rate-limited keys are
// rotated; a model that keeps failing hands over to the next one in the chain.
class LlmService : public LanguageModelClient, public EmbeddingClient {
public:
    LlmService(std::shared_ptr<KeyManager> key_manager, LlmSettings settings,
               std::shared_ptr<CacheManager> cache = nullptr);

    nlohmann::json generate_structured(const std::string& prompt, const nlohmann::json& schema) override;
    std::vector<float> embed(const std::string& text) override;

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<CacheManager> cache_manager_;
    LlmSettings settings_;

    std::string endpoint(const std::string& path) const;
    std::optional<nlohmann::json> try_model(const std::string& model, const std::string& prompt,
                                            const nlohmann::json& schema, int& last_status);
};

} // namespace merlt
