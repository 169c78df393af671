#include "llm_service.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <regex>
#include <thread>
#include <chrono>
#include "orchestrator_errors.hpp"
#include "SystemMonitor.hpp"

namespace merlt {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

std::string extract_json_payload(const std::string& raw) {
    std::regex md_regex(R"(```(?:json)?\s*(\{[\s\S]*?\})\s*```)");
    std::smatch match;
    if (std::regex_search(raw, match, md_regex)) return match.str(1);

    auto first = raw.find('{');
    auto last = raw.rfind('}');
    if (first != std::string::npos && last != std::string::npos && last > first) {
        return raw.substr(first, last - first + 1);
    }
    return "";
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, const std::shared_ptr<KeyManager>& km, int max_retries) {
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);

            km->report_rate_limit();

            // Back off a little longer each time (2s, 3s, 4s...)
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

LlmService::LlmService(std::shared_ptr<KeyManager> key_manager, LlmSettings settings,
                       std::shared_ptr<CacheManager> cache)
    : key_manager_(std::move(key_manager)),
      cache_manager_(cache ? std::move(cache) : std::make_shared<CacheManager>()),
      settings_(std::move(settings)) {
    if (!key_manager_) throw std::invalid_argument("LlmService requires a key manager");
}

std::string LlmService::endpoint(const std::string& path) const {
    std::string base = settings_.base_url;
    if (!base.empty() && base.back() == '/') base.pop_back();
    return base + path;
}

std::optional<json> LlmService::try_model(const std::string& model, const std::string& prompt,
                                          const json& schema, int& last_status) {
    json payload = {
        {"model", model},
        {"temperature", settings_.temperature},
        {"messages", json::array({
            {{"role", "system"}, {"content", "You are a component of a legal reasoning pipeline. "
                                             "Reply with a single JSON value that matches the given schema."}},
            {{"role", "user"}, {"content", prompt}}
        })},
        {"response_format", {
            {"type", "json_schema"},
            {"json_schema", {{"name", "response"}, {"schema", schema}}}
        }}
    };
    std::string body = payload.dump(-1, ' ', false, json::error_handler_t::replace);

    auto r = perform_request_with_retry([&]() {
        // A fresh header every attempt so a rotated key is picked up
        return cpr::Post(cpr::Url{endpoint("/chat/completions")},
                         cpr::Body{body},
                         cpr::Header{{"Content-Type", "application/json"},
                                     {"Authorization", "Bearer " + key_manager_->get_current_key()}},
                         cpr::Timeout{settings_.request_timeout_ms});
    }, key_manager_, settings_.max_retries);

    last_status = static_cast<int>(r.status_code);
    if (r.status_code != 200) {
        spdlog::error("❌ Model {} failed [{}]: {}", model, r.status_code,
                      utf8_safe_substr(r.error.message.empty() ? r.text : r.error.message, 300));
        return std::nullopt;
    }

    std::string content;
    try {
        auto response_json = json::parse(r.text);
        content = response_json.at("choices").at(0).at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        spdlog::error("❌ Model {} returned an unexpected envelope: {}", model, e.what());
        return std::nullopt;
    }

    std::string payload_text = extract_json_payload(content);
    if (!payload_text.empty()) {
        try {
            return json::parse(payload_text);
        } catch (const json::parse_error& e) {
            spdlog::warn("⚠️ Model {} produced invalid JSON: {}", model, e.what());
        }
    }
    // The caller decides what a non-conforming reply means.
    return json(content);
}

json LlmService::generate_structured(const std::string& prompt, const json& schema) {
    auto start = std::chrono::high_resolution_clock::now();
    int last_status = 0;

    for (const auto& model : key_manager_->get_model_chain()) {
        if (key_manager_->get_current_key().empty()) break;
        if (auto result = try_model(model, prompt, schema, last_status)) {
            auto end = std::chrono::high_resolution_clock::now();
            SystemMonitor::global_llm_latency_ms.store(std::chrono::duration<double, std::milli>(end - start).count());
            return *result;
        }
        spdlog::warn("🔀 Falling back from model {}", model);
    }

    throw LanguageModelError("all models in the chain failed (last status " + std::to_string(last_status) + ")",
                             last_status);
}

std::vector<float> LlmService::embed(const std::string& text) {
    if (auto cached = cache_manager_->get_embedding(text)) return *cached;

    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{endpoint("/embeddings")},
                         cpr::Body(json{
                             {"model", settings_.embedding_model},
                             {"input", text}
                         }.dump(-1, ' ', false, json::error_handler_t::replace)),
                         cpr::Header{{"Content-Type", "application/json"},
                                     {"Authorization", "Bearer " + key_manager_->get_current_key()}},
                         cpr::Timeout{settings_.request_timeout_ms});
    }, key_manager_, settings_.max_retries);

    if (r.status_code != 200) {
        spdlog::error("❌ Embedding API Fatal Error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 300));
        throw LanguageModelError("failed to generate embedding after retries", static_cast<int>(r.status_code));
    }

    std::vector<float> embedding;
    try {
        auto response_json = json::parse(r.text);
        embedding = response_json.at("data").at(0).at("embedding").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw LanguageModelError(std::string("malformed embedding response: ") + e.what(), 200);
    }
    cache_manager_->set_embedding(text, embedding);
    return embedding;
}

} // namespace merlt
