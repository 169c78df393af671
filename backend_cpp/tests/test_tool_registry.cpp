#include <gtest/gtest.h>
#include "fakes.hpp"
#include "tools/RetrievalTools.hpp"

using namespace merlt;
using namespace merlt::fakes;

class ToolRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<FakeKnowledgeStore>();
        store->chunks = {
            {"c1", "urn:nir:stato:legge:1990;241~art3", "Ogni provvedimento deve essere motivato", "norma", 0.9},
            {"c2", "urn:nir:stato:legge:1990;241~art21", "Annullabilità del provvedimento", "norma", 0.85},
            {"c3", "urn:nir:stato:legge:1990;241~art22", "Accesso ai documenti", "norma", 0.8},
            {"c4", "urn:nir:stato:legge:1990;241~art23", "Ambito del diritto di accesso", "norma", 0.75},
            {"s1", "urn:cass:2019:1234", "Sul difetto di motivazione", "sentenza", 0.7},
            {"p1", "urn:cost:art97", "Buon andamento", "principio", 0.6},
        };
        store->neighbours["urn:nir:stato:legge:1990;241~art3"] = {
            {"d1", "urn:def:provvedimento", "definizione di provvedimento", "definisce", 1, 0.6},
            {"h1", "urn:legge:2005;15", "modifica del 2005", "modifica", 1, 0.6},
            {"s2", "urn:cass:2020:999", "sentenza applicativa", "applica", 1, 0.6},
        };
        auto weights = std::make_shared<TraversalWeightStore>(OrchestratorConfig::defaults().traversal);
        engine = std::make_shared<RetrievalEngine>(store, weights);
        register_retrieval_tools(registry, engine);
    }

    static ExecutionPlan plan(bool kg, bool api, bool vectordb) {
        ExecutionPlan p;
        p.kg_agent = kg;
        p.api_agent = api;
        p.vectordb_agent = vectordb;
        p.experts = {ExpertId::Literal};
        return p;
    }

    std::shared_ptr<FakeKnowledgeStore> store;
    std::shared_ptr<RetrievalEngine> engine;
    ToolRegistry registry;
    ToolCall call{ExpertId::Literal, 8, 2};
};

TEST_F(ToolRegistryTest, AvailableRespectsPlanAgents) {
    std::vector<std::string> literal = {"semantic_search", "norm_lookup", "find_definitions", "traverse_relations"};

    auto kg_only = registry.available(literal, plan(true, false, false));
    EXPECT_EQ(kg_only, (std::vector<std::string>{"find_definitions", "traverse_relations"}));

    auto all = registry.available(literal, plan(true, true, true));
    EXPECT_EQ(all.size(), 4u);

    EXPECT_TRUE(registry.available({"no_such_tool"}, plan(true, true, true)).empty());
}

TEST_F(ToolRegistryTest, ManifestListsParameters) {
    auto manifest = registry.get_manifest_json({"semantic_search", "find_citations"});
    ASSERT_EQ(manifest.size(), 2u);
    EXPECT_EQ(manifest[0]["name"].get<std::string>(), "semantic_search");
    EXPECT_TRUE(manifest[0]["parameters"]["properties"].contains("query"));
}

TEST_F(ToolRegistryTest, UnknownToolIsAnErrorObservation) {
    auto res = registry.dispatch("delete_everything", json::object(), call);
    EXPECT_FALSE(res.ok);
    EXPECT_TRUE(res.observation.contains("error"));
}

TEST_F(ToolRegistryTest, BadArgumentsAreReportedNotThrown) {
    auto res = registry.dispatch("semantic_search", json{{"top_k", 3}}, call);
    EXPECT_FALSE(res.ok);
    EXPECT_NE(res.observation["error"].get<std::string>().find("bad arguments"), std::string::npos);

    auto wrong_type = registry.dispatch("traverse_relations",
                                        json{{"start_node", "x"}, {"relation_types", "cita"}}, call);
    EXPECT_FALSE(wrong_type.ok);
}

TEST_F(ToolRegistryTest, SemanticSearchCollectsEvidence) {
    long long before = SystemMonitor::global_tool_calls.load();
    auto res = registry.dispatch("semantic_search", json{{"query", "motivazione"}, {"top_k", 2}}, call);
    ASSERT_TRUE(res.ok);
    EXPECT_EQ(res.evidence.size(), 2u);
    EXPECT_EQ(res.observation["count"].get<int>(), 2);
    EXPECT_EQ(SystemMonitor::global_tool_calls.load(), before + 1);
}

TEST_F(ToolRegistryTest, OutOfRangeNumbersAreClamped) {
    auto tiny = registry.dispatch("semantic_search", json{{"query", "motivazione"}, {"top_k", -1e20}}, call);
    ASSERT_TRUE(tiny.ok);
    EXPECT_EQ(tiny.evidence.size(), 1u);

    auto huge = registry.dispatch("semantic_search", json{{"query", "motivazione"}, {"top_k", 1e20}}, call);
    ASSERT_TRUE(huge.ok);
    EXPECT_LE(huge.evidence.size(), static_cast<size_t>(call.top_k));
}

TEST_F(ToolRegistryTest, NormLookupFiltersByUrnAndCapsResults) {
    auto by_urn = registry.dispatch("norm_lookup", json{{"urn", "urn:nir:stato:legge:1990;241~art2"}}, call);
    ASSERT_TRUE(by_urn.ok);
    ASSERT_EQ(by_urn.evidence.size(), 3u);
    for (const auto& e : by_urn.evidence) EXPECT_EQ(e.source_type, "norma");

    auto none = registry.dispatch("norm_lookup", json::object(), call);
    EXPECT_FALSE(none.ok);
}

TEST_F(ToolRegistryTest, FamilyToolsFollowTheirRelations) {
    json start = {{"start_node", "urn:nir:stato:legge:1990;241~art3"}};

    auto defs = registry.dispatch("find_definitions", start, call);
    ASSERT_EQ(defs.evidence.size(), 1u);
    EXPECT_EQ(defs.evidence[0].relation, "definisce");

    auto history = registry.dispatch("norm_history", start, call);
    ASSERT_EQ(history.evidence.size(), 1u);
    EXPECT_EQ(history.evidence[0].relation, "modifica");

    auto cites = registry.dispatch("find_citations", start, call);
    ASSERT_EQ(cites.evidence.size(), 1u);
    EXPECT_EQ(cites.evidence[0].relation, "applica");

    EXPECT_FALSE(registry.dispatch("find_definitions", json::object(), call).ok);
}

TEST_F(ToolRegistryTest, QueryModeSearchesBySourceType) {
    auto cites = registry.dispatch("find_citations", json{{"query", "motivazione"}}, call);
    ASSERT_EQ(cites.evidence.size(), 1u);
    EXPECT_EQ(cites.evidence[0].source_type, "sentenza");

    auto principles = registry.dispatch("find_principles", json{{"query", "buon andamento"}}, call);
    ASSERT_EQ(principles.evidence.size(), 1u);
    EXPECT_EQ(principles.evidence[0].urn, "urn:cost:art97");
}

TEST_F(ToolRegistryTest, FailingToolBecomesErrorObservation) {
    registry.register_tool(std::make_unique<GenericTool>(
        "flaky", "always fails", json::object(), RetrievalAgent::Api,
        [](const json&, const ToolCall&) -> ToolResult { throw std::runtime_error("backend offline"); }));

    auto res = registry.dispatch("flaky", json::object(), call);
    EXPECT_FALSE(res.ok);
    EXPECT_NE(res.observation["error"].get<std::string>().find("backend offline"), std::string::npos);
}
