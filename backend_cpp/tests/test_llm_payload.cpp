#include <gtest/gtest.h>
#include "KeyManager.hpp"
#include "llm_service.hpp"

using namespace merlt;
using json = nlohmann::json;

TEST(JsonPayloadTest, PrefersFencedBlock) {
    std::string reply = "Ecco il piano:\n```json\n{\"experts\": [\"literal\"]}\n```\nAltro {rumore}";
    EXPECT_EQ(json::parse(extract_json_payload(reply))["experts"][0].get<std::string>(), "literal");
}

TEST(JsonPayloadTest, FallsBackToOutermostBraces) {
    std::string reply = "Risposta: {\"action\": \"tool\", \"parameters\": {\"query\": \"art. 1425\"}} fine";
    auto j = json::parse(extract_json_payload(reply));
    EXPECT_EQ(j["parameters"]["query"].get<std::string>(), "art. 1425");
}

TEST(JsonPayloadTest, EmptyWhenNoObject) {
    EXPECT_TRUE(extract_json_payload("Non so rispondere").empty());
    EXPECT_TRUE(extract_json_payload("} rovesciato {").empty());
}

TEST(Utf8SubstrTest, NeverSplitsMultibyteCharacters) {
    std::string s = "libertà";   // 'à' is two bytes at the end
    EXPECT_EQ(utf8_safe_substr(s, s.size()), s);
    EXPECT_EQ(utf8_safe_substr(s, s.size() - 1), "libert");
    EXPECT_EQ(utf8_safe_substr("abc", 10), "abc");
    EXPECT_EQ(utf8_safe_substr("abc", 0), "");
}

TEST(KeyManagerTest, ModelChainAndRotation) {
    KeyManager km("/nonexistent/keys.json");
    EXPECT_TRUE(km.get_current_key().empty());

    km.load_json(json::parse(R"({"keys": ["k1", "k2"], "primary": "m-main", "fallbacks": ["m-small"]})"));
    EXPECT_EQ(km.get_model_chain(), (std::vector<std::string>{"m-main", "m-small"}));
    EXPECT_EQ(km.get_current_key(), "k1");

    km.report_rate_limit();
    EXPECT_EQ(km.get_current_key(), "k2");
    EXPECT_EQ(km.get_active_key_count(), 2u);
}

TEST(KeyManagerTest, RepeatedRateLimitsDecommissionKey) {
    KeyManager km("/nonexistent/keys.json");
    km.load_json(json::parse(R"({"keys": ["only"]})"));
    for (int i = 0; i < 3; ++i) km.report_rate_limit();
    EXPECT_EQ(km.get_active_key_count(), 0u);
    EXPECT_TRUE(km.get_current_key().empty());
    EXPECT_EQ(km.get_model_chain().front(), "openai/gpt-4o-mini");
}
