#include <gtest/gtest.h>
#include "fakes.hpp"
#include "retrieval_engine.hpp"

using namespace merlt;
using namespace merlt::fakes;

class RetrievalEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<FakeKnowledgeStore>();
        store->chunks = {
            {"c1", "urn:art1", "Il contratto è l'accordo...", "norma", 0.9},
            {"c2", "urn:cass1", "La Cassazione ha chiarito...", "sentenza", 0.8},
            {"c3", "urn:art2", "Il contratto ha forza di legge...", "norma", 0.4},
        };
        store->neighbours["urn:art1"] = {
            {"n1", "urn:def1", "definizione", "definisce", 1, 0.6},
            {"n2", "urn:cass2", "sentenza citante", "cita", 1, 0.6},
            {"n3", "urn:law3", "legge modificativa", "modifica", 2, 0.37},
        };
        weights = std::make_shared<TraversalWeightStore>(OrchestratorConfig::defaults().traversal);
        engine = std::make_shared<RetrievalEngine>(store, weights);
    }

    std::shared_ptr<FakeKnowledgeStore> store;
    std::shared_ptr<TraversalWeightStore> weights;
    std::shared_ptr<RetrievalEngine> engine;
};

TEST_F(RetrievalEngineTest, SearchScalesBySemanticWeight) {
    auto out = engine->search(ExpertId::Literal, "contratto", {}, 5);
    ASSERT_EQ(out.size(), 3u);
    double w = weights->weight(ExpertId::Literal, RetrievalEngine::kSemanticRelation);
    EXPECT_EQ(out[0].id, "c1");
    EXPECT_EQ(out[0].relation, RetrievalEngine::kSemanticRelation);
    EXPECT_NEAR(out[0].score, 0.9 * w, 1e-12);
    EXPECT_DOUBLE_EQ(out[0].raw_score, 0.9);
}

TEST_F(RetrievalEngineTest, SearchPassesFilters) {
    auto out = engine->search(ExpertId::Precedent, "contratto", {{"source_type", "sentenza"}}, 5);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].urn, "urn:cass1");
}

TEST_F(RetrievalEngineTest, TraversalRanksByExpertWeights) {
    // Literal favours definitions, Precedent favours citations
    auto literal = engine->traverse(ExpertId::Literal, "urn:art1", {"definisce", "cita"}, 2, 5);
    auto precedent = engine->traverse(ExpertId::Precedent, "urn:art1", {"definisce", "cita"}, 2, 5);
    ASSERT_EQ(literal.size(), 2u);
    ASSERT_EQ(precedent.size(), 2u);
    EXPECT_EQ(literal[0].relation, "definisce");
    EXPECT_EQ(precedent[0].relation, "cita");
    EXPECT_EQ(literal[0].source_type, "graph");
}

TEST_F(RetrievalEngineTest, TraversalFollowsLearnedWeights) {
    auto before = engine->traverse(ExpertId::Precedent, "urn:art1", {"definisce", "cita"}, 2, 5);
    ASSERT_EQ(before[0].relation, "cita");

    weights->update(ExpertId::Precedent, {{"cita", -6.0}, {"definisce", 6.0}});
    auto after = engine->traverse(ExpertId::Precedent, "urn:art1", {"definisce", "cita"}, 2, 5);
    EXPECT_EQ(after[0].relation, "definisce");
    EXPECT_NEAR(after[0].relation_weight, weights->weight(ExpertId::Precedent, "definisce"), 1e-12);
}

TEST_F(RetrievalEngineTest, EmptyRelationListUsesExpertRelations) {
    engine->traverse(ExpertId::Systemic, "urn:art1", {}, 2, 5);
    EXPECT_FALSE(store->last_relations.empty());
    EXPECT_EQ(std::count(store->last_relations.begin(), store->last_relations.end(),
                         RetrievalEngine::kSemanticRelation), 0);
    EXPECT_EQ(store->last_weights.size(), store->last_relations.size());
    EXPECT_NEAR(store->last_weights["modifica"], weights->weight(ExpertId::Systemic, "modifica"), 1e-12);
}

TEST_F(RetrievalEngineTest, TopKTruncates) {
    auto out = engine->search(ExpertId::Literal, "contratto", {}, 2);
    EXPECT_EQ(out.size(), 2u);
}

TEST(WeightedEvidenceTest, SourceUsesUrnAndShortExcerpt) {
    WeightedEvidence e;
    e.id = "c9";
    e.urn = "urn:art9";
    e.text = std::string(1000, 'a');
    e.relation = "definisce";
    e.score = 0.4;
    auto src = e.to_source();
    EXPECT_EQ(src.source_id, "urn:art9");
    EXPECT_LT(src.excerpt.size(), e.text.size());

    e.urn.clear();
    EXPECT_EQ(e.to_source().source_id, "c9");
}
