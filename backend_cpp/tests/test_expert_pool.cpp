#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "agent/ExpertPool.hpp"
#include "agent/ExpertProfiles.hpp"
#include "fakes.hpp"
#include "tools/RetrievalTools.hpp"

using namespace merlt;
using namespace merlt::fakes;

namespace {

const ExpertOpinion& opinion_of(const std::vector<ExpertOpinion>& ops, ExpertId id) {
    for (const auto& op : ops) {
        if (op.expert == id) return op;
    }
    throw std::runtime_error("no opinion for " + to_string(id));
}

}

class ExpertPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto store = std::make_shared<FakeKnowledgeStore>();
        auto weights = std::make_shared<TraversalWeightStore>(OrchestratorConfig::defaults().traversal);
        tools = std::make_shared<ToolRegistry>();
        register_retrieval_tools(*tools, std::make_shared<RetrievalEngine>(store, weights));

        settings.timeout_ms = 150;
        settings.max_tool_rounds = 2;
        settings.worker_threads = 4;

        query.trace_id = "t-pool";
        query.query_text = "Quali limiti incontra la libertà di stampa?";
        plan.kg_agent = true;
        plan.vectordb_agent = true;
    }

    // Every expert finalizes at once; `behaviour` decides the opinion per expert.
    std::unique_ptr<ExpertPool> make_pool(std::function<json(const std::string& expert)> behaviour,
                                          std::vector<ExpertId> ids = {kAllExperts.begin(), kAllExperts.end()}) {
        auto llm = std::make_shared<ScriptedLanguageModel>([behaviour](const std::string& prompt, const json& schema) -> json {
            if (is_action_request(schema)) return {{"action", "finalize"}};
            return behaviour(addressed_expert(prompt));
        });
        std::vector<std::shared_ptr<ReasoningExpert>> experts;
        for (auto id : ids) {
            experts.push_back(std::make_shared<ReasoningExpert>(profile_for(id), llm, tools, settings));
        }
        return std::make_unique<ExpertPool>(experts, settings);
    }

    std::shared_ptr<ToolRegistry> tools;
    ExpertSettings settings;
    QueryContext query;
    ExecutionPlan plan;
};

TEST_F(ExpertPoolTest, ReturnsOneOpinionPerSelectedExpert) {
    auto pool = make_pool([](const std::string& who) { return opinion_json("opinione " + who, 0.7); });
    plan.experts = {ExpertId::Literal, ExpertId::Precedent};

    auto ops = pool->run(plan, query, EnrichedContext{});
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(opinion_of(ops, ExpertId::Literal).interpretation, "opinione literal");
    EXPECT_EQ(opinion_of(ops, ExpertId::Precedent).interpretation, "opinione precedent");
}

TEST_F(ExpertPoolTest, SlowExpertTimesOutWithoutBlockingTheOthers) {
    auto pool = make_pool([](const std::string& who) {
        if (who == "precedent") std::this_thread::sleep_for(std::chrono::milliseconds(800));
        return opinion_json("opinione " + who, 0.6);
    });
    plan.experts = {ExpertId::Literal, ExpertId::Systemic, ExpertId::Principles, ExpertId::Precedent};

    auto started = std::chrono::steady_clock::now();
    auto ops = pool->run(plan, query, EnrichedContext{});
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    ASSERT_EQ(ops.size(), 4u);
    const auto& slow = opinion_of(ops, ExpertId::Precedent);
    EXPECT_TRUE(slow.has_limitation(kLimitTimedOut));
    EXPECT_DOUBLE_EQ(slow.confidence, 0.0);
    EXPECT_FALSE(slow.usable());
    EXPECT_TRUE(opinion_of(ops, ExpertId::Literal).usable());
    EXPECT_TRUE(opinion_of(ops, ExpertId::Principles).usable());

    // Bounded by the deadline, not by the slow expert
    EXPECT_LT(waited.count(), 600);
}

TEST_F(ExpertPoolTest, OverrunningExpertsDoNotStarveTheNextRequest) {
    auto slow = std::make_shared<std::atomic<bool>>(true);
    auto pool = make_pool([slow](const std::string& who) {
        if (slow->load()) std::this_thread::sleep_for(std::chrono::milliseconds(700));
        return opinion_json("opinione " + who, 0.6);
    });
    plan.experts = {ExpertId::Literal, ExpertId::Systemic, ExpertId::Principles, ExpertId::Precedent};

    auto first = pool->run(plan, query, EnrichedContext{});
    for (const auto& op : first) EXPECT_TRUE(op.has_limitation(kLimitTimedOut));

    // The first request's experts still hold their workers
    slow->store(false);
    query.trace_id = "t-pool-2";
    auto second = pool->run(plan, query, EnrichedContext{});
    ASSERT_EQ(second.size(), 4u);
    for (const auto& op : second) {
        EXPECT_TRUE(op.usable()) << to_string(op.expert);
        EXPECT_FALSE(op.has_limitation(kLimitTimedOut));
    }
    EXPECT_EQ(pool->lane_count(), 2u);
}

TEST_F(ExpertPoolTest, IdleLanesAreReused) {
    auto pool = make_pool([](const std::string& who) { return opinion_json(who, 0.5); });
    plan.experts = {ExpertId::Literal, ExpertId::Systemic, ExpertId::Principles, ExpertId::Precedent};
    for (int i = 0; i < 3; ++i) {
        auto ops = pool->run(plan, query, EnrichedContext{});
        ASSERT_EQ(ops.size(), 4u);
    }
    EXPECT_EQ(pool->lane_count(), 1u);
}

TEST_F(ExpertPoolTest, FailingExpertIsReportedAsError) {
    auto pool = make_pool([](const std::string& who) -> json {
        if (who == "systemic") throw LanguageModelError("provider exhausted", 429);
        return opinion_json("opinione " + who, 0.6);
    });
    plan.experts = {ExpertId::Literal, ExpertId::Systemic};

    auto ops = pool->run(plan, query, EnrichedContext{});
    const auto& failed = opinion_of(ops, ExpertId::Systemic);
    EXPECT_TRUE(failed.has_limitation(kLimitExpertError));
    EXPECT_DOUBLE_EQ(failed.confidence, 0.0);
    EXPECT_TRUE(opinion_of(ops, ExpertId::Literal).usable());
}

TEST_F(ExpertPoolTest, UnregisteredExpertIsReportedAsError) {
    auto pool = make_pool([](const std::string& who) { return opinion_json(who, 0.5); }, {ExpertId::Literal});
    plan.experts = {ExpertId::Literal, ExpertId::Principles};

    EXPECT_FALSE(pool->has(ExpertId::Principles));
    auto ops = pool->run(plan, query, EnrichedContext{});
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_TRUE(opinion_of(ops, ExpertId::Principles).has_limitation(kLimitExpertError));
}

TEST_F(ExpertPoolTest, CancelledRequestYieldsCancelledOpinions) {
    auto pool = make_pool([](const std::string& who) { return opinion_json(who, 0.5); });
    plan.experts = {ExpertId::Literal, ExpertId::Systemic};

    auto cancel = std::make_shared<CancellationToken>();
    cancel->cancel();
    auto ops = pool->run(plan, query, EnrichedContext{}, cancel);
    ASSERT_EQ(ops.size(), 2u);
    for (const auto& op : ops) {
        EXPECT_TRUE(op.has_limitation(kLimitCancelled));
        EXPECT_FALSE(op.usable());
    }
}
