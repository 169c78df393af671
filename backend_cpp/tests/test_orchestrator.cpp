#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "agent/ExpertProfiles.hpp"
#include "fakes.hpp"
#include "memory/LocalStores.hpp"
#include "orchestrator.hpp"
#include "orchestrator_errors.hpp"
#include "tools/RetrievalTools.hpp"

using namespace merlt;
using namespace merlt::fakes;

// Wires the real router, gate, pool, synthesizer and feedback path around a
// scripted model. Tests choose the plans and the per-expert opinions.
class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = OrchestratorConfig::defaults();
        config.gating.input_dim = 8;
        config.experts.timeout_ms = 150;
        config.experts.max_tool_rounds = 2;
        config.experts.worker_threads = 4;

        llm = std::make_shared<ScriptedLanguageModel>([this](const std::string& prompt, const json& schema) -> json {
            if (is_plan_request(schema)) {
                std::lock_guard<std::mutex> lock(script_mtx);
                router_prompts.push_back(prompt);
                if (cancel_during_plan) cancel_during_plan->cancel();
                size_t i = std::min(plan_calls++, plans.size() - 1);
                return plans[i];
            }
            if (is_action_request(schema)) return {{"action", "finalize"}};
            return opinion_for(addressed_expert(prompt));
        });
        embedder = std::make_shared<FakeEmbedder>(config.gating.input_dim);

        auto store = std::make_shared<FakeKnowledgeStore>();
        auto traversal = std::make_shared<TraversalWeightStore>(config.traversal);
        auto tools = std::make_shared<ToolRegistry>();
        register_retrieval_tools(*tools, std::make_shared<RetrievalEngine>(store, traversal));

        std::vector<std::shared_ptr<ReasoningExpert>> experts;
        for (const auto& profile : default_profiles()) {
            experts.push_back(std::make_shared<ReasoningExpert>(profile, llm, tools, config.experts));
        }

        auto gating = std::make_shared<GatingNetwork>(config.gating);
        traces = std::make_shared<LogManager>(32);

        users = std::make_shared<FakeUserStore>();
        users->users["mag.bianchi"] = UserProfile{"mag.bianchi", "magistrato", UserHistory{0.8, 0.7, 0.9, 120}};

        FeedbackProcessor::Dependencies fdeps;
        fdeps.gating = gating;
        fdeps.traversal = traversal;
        fdeps.authority = std::make_shared<AuthorityScorer>(users, config.authority);
        fdeps.idempotence = std::make_shared<InMemoryIdempotenceStore>();
        fdeps.traces = traces;

        Orchestrator::Components c;
        c.router = std::make_shared<PlanRouter>(llm, config.router);
        c.gating = gating;
        c.experts = std::make_shared<ExpertPool>(experts, config.experts);
        c.synthesizer = std::make_shared<Synthesizer>(std::make_shared<LexicalAgreementScorer>(), config.synthesizer);
        c.feedback = std::make_shared<FeedbackProcessor>(fdeps, config.feedback, config.traversal);
        c.embedder = embedder;
        c.traces = traces;
        orchestrator = std::make_unique<Orchestrator>(c, config.orchestrator);
    }

    // Joins expert workers still sleeping past their deadline while the script is alive.
    void TearDown() override { orchestrator.reset(); }

    json opinion_for(const std::string& expert) {
        std::function<json(const std::string&)> fn;
        {
            std::lock_guard<std::mutex> lock(script_mtx);
            fn = opinions;
        }
        return fn(expert);
    }

    QueryContext query(const std::string& text, const std::string& intent, double complexity) {
        QueryContext q;
        q.trace_id = "t-" + intent;
        q.query_text = text;
        q.intents = {Intent{intent, 0.9}};
        q.complexity = complexity;
        return q;
    }

    OrchestratorConfig config;
    std::shared_ptr<ScriptedLanguageModel> llm;
    std::shared_ptr<FakeEmbedder> embedder;
    std::shared_ptr<LogManager> traces;
    std::shared_ptr<FakeUserStore> users;
    std::unique_ptr<Orchestrator> orchestrator;

    std::mutex script_mtx;
    std::vector<json> plans;
    size_t plan_calls = 0;
    std::vector<std::string> router_prompts;
    std::function<json(const std::string&)> opinions;
    std::shared_ptr<CancellationToken> cancel_during_plan;
};

TEST_F(OrchestratorTest, SimpleValidityQueryConverges) {
    plans = {plan_json({"literal"})};
    opinions = [](const std::string&) {
        return opinion_json("Il contratto concluso dal minore è annullabile ai sensi dell'art. 1425 c.c.", 0.82);
    };

    std::vector<std::string> phases;
    auto ans = orchestrator->handle_query(
        query("Il contratto firmato da un sedicenne è valido?", "validità_atto", 0.3), EnrichedContext{},
        [&](const std::string& phase, const json&) { phases.push_back(phase); });

    EXPECT_EQ(ans.mode, SynthesisMode::Convergent);
    EXPECT_NEAR(ans.confidence, 0.82, 1e-9);
    EXPECT_EQ(ans.iterations, 1);
    EXPECT_EQ(ans.plan.experts, std::vector<ExpertId>{ExpertId::Literal});
    EXPECT_EQ(phases, (std::vector<std::string>{"PLAN", "EXPERTS", "SYNTHESIS", "FINAL"}));

    auto trace = traces->find("t-validità_atto");
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->mode, "convergent");
    EXPECT_TRUE(trace->error.empty());
    EXPECT_EQ(trace->query_embedding.size(), config.gating.input_dim);
}

TEST_F(OrchestratorTest, ConflictingExpertsDiverge) {
    plans = {plan_json({"literal", "systemic", "principles", "precedent"}, true, true, true)};
    opinions = [](const std::string& who) {
        if (who == "literal") return opinion_json("contratto annullabile incapacità legale", 0.9);
        if (who == "systemic") return opinion_json("contratto tutela minore sistema", 0.7);
        if (who == "principles") return opinion_json("contratto tutela persona dignità", 0.8);
        return opinion_json("contratto annullabile giurisprudenza costante", 0.6);
    };

    auto ans = orchestrator->handle_query(
        query("Quali diritti prevalgono?", "bilanciamento_diritti", 0.9), EnrichedContext{});

    EXPECT_EQ(ans.mode, SynthesisMode::Divergent);
    EXPECT_LT(ans.min_agreement, config.synthesizer.agreement_threshold);
    EXPECT_GT(ans.confidence, 0.0);
    EXPECT_LT(ans.confidence, 0.9);
    EXPECT_TRUE(ans.favoured_expert.has_value());
    EXPECT_EQ(ans.opinions.size(), 4u);
}

TEST_F(OrchestratorTest, AllExpertsTimingOutIsInsufficientEvidence) {
    plans = {plan_json({"literal", "precedent"})};
    opinions = [](const std::string& who) {
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return opinion_json("troppo tardi " + who, 0.9);
    };

    try {
        orchestrator->handle_query(query("Domanda lenta", "validità_atto", 0.5), EnrichedContext{});
        FAIL() << "expected InsufficientEvidence";
    } catch (const InsufficientEvidence& e) {
        EXPECT_EQ(e.trace_id(), "t-validità_atto");
        EXPECT_EQ(e.stage(), "synthesis");
    }
    auto trace = traces->find("t-validità_atto");
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->error, "InsufficientEvidence");
}

TEST_F(OrchestratorTest, CancelledRequestNeverPlans) {
    plans = {plan_json({"literal"})};
    opinions = [](const std::string& who) { return opinion_json(who, 0.8); };
    auto cancel = std::make_shared<CancellationToken>();
    cancel->cancel();

    EXPECT_THROW(orchestrator->handle_query(query("Domanda", "validità_atto", 0.3), EnrichedContext{}, nullptr, cancel),
                 RequestCancelled);
    EXPECT_EQ(plan_calls, 0u);
    auto trace = traces->find("t-validità_atto");
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->error, "RequestCancelled");
}

TEST_F(OrchestratorTest, CancellationDuringPlanningSkipsExperts) {
    plans = {plan_json({"literal", "precedent"})};
    opinions = [](const std::string& who) { return opinion_json(who, 0.8); };
    cancel_during_plan = std::make_shared<CancellationToken>();

    std::vector<std::string> phases;
    EXPECT_THROW(orchestrator->handle_query(query("Domanda", "validità_atto", 0.3), EnrichedContext{},
                                            [&](const std::string& phase, const json&) { phases.push_back(phase); },
                                            cancel_during_plan),
                 RequestCancelled);
    EXPECT_EQ(plan_calls, 1u);
    EXPECT_TRUE(phases.empty());
}

TEST_F(OrchestratorTest, IntentRuleForcesReplanning) {
    plans = {plan_json({"literal"}), plan_json({"literal", "precedent"})};
    opinions = [](const std::string& who) { return opinion_json("la giurisprudenza è costante " + who, 0.7); };

    int plan_retry = -1;
    auto ans = orchestrator->handle_query(
        query("Come decide la Cassazione?", "orientamento_giurisprudenziale", 0.6), EnrichedContext{},
        [&](const std::string& phase, const json& payload) {
            if (phase == "PLAN") plan_retry = payload["retry_count"].get<int>();
        });

    EXPECT_EQ(plan_retry, 1);
    EXPECT_TRUE(ans.plan.selects(ExpertId::Precedent));
    ASSERT_EQ(router_prompts.size(), 2u);
    EXPECT_NE(router_prompts[1].find("requires expert 'precedent'"), std::string::npos);
}

TEST_F(OrchestratorTest, RejectedPlansExhaustRetries) {
    plans = {plan_json({"literal"}, false, false, false)};
    opinions = [](const std::string& who) { return opinion_json(who, 0.5); };

    try {
        orchestrator->handle_query(query("Domanda", "definizione", 0.2), EnrichedContext{});
        FAIL() << "expected MaxRetriesExceeded";
    } catch (const MaxRetriesExceeded& e) {
        EXPECT_EQ(e.retry_count(), config.router.max_retries);
        EXPECT_TRUE(e.degraded_service());
    }
    EXPECT_EQ(plan_calls, static_cast<size_t>(config.router.max_retries + 1));
}

TEST_F(OrchestratorTest, WeakAnswerIsRefined) {
    plans = {plan_json({"literal"}, true, false, true, 2, 0.75)};
    std::atomic<int> rounds{0};
    opinions = [&](const std::string&) {
        return opinion_json("Il termine decorre dalla notifica", rounds++ == 0 ? 0.5 : 0.8);
    };

    auto ans = orchestrator->handle_query(query("Da quando decorre il termine?", "definizione", 0.4), EnrichedContext{});
    EXPECT_EQ(ans.iterations, 2);
    EXPECT_NEAR(ans.confidence, 0.8, 1e-9);
    ASSERT_EQ(router_prompts.size(), 2u);
    EXPECT_NE(router_prompts[1].find("Iteration 1 reached confidence 0.50"), std::string::npos);
}

TEST_F(OrchestratorTest, RefinementKeepsBestIteration) {
    plans = {plan_json({"literal"}, true, false, true, 2, 0.9)};
    std::atomic<int> rounds{0};
    opinions = [&](const std::string&) {
        return opinion_json("Il termine decorre dalla notifica", rounds++ == 0 ? 0.6 : 0.4);
    };

    auto ans = orchestrator->handle_query(query("Da quando decorre il termine?", "definizione", 0.4), EnrichedContext{});
    EXPECT_EQ(ans.iterations, 1);
    EXPECT_NEAR(ans.confidence, 0.6, 1e-9);
}

TEST_F(OrchestratorTest, IterationsAreCapped) {
    plans = {plan_json({"literal"}, true, false, true, 10, 1.0)};
    opinions = [](const std::string&) { return opinion_json("Risposta incerta", 0.3); };

    auto ans = orchestrator->handle_query(query("Domanda", "definizione", 0.4), EnrichedContext{});
    EXPECT_EQ(plan_calls, static_cast<size_t>(config.orchestrator.max_iterations_cap));
    EXPECT_EQ(ans.iterations, 1);
}

TEST_F(OrchestratorTest, EmbeddingFailureRoutesOnPriors) {
    embedder->fail = true;
    plans = {plan_json({"literal", "precedent"})};
    opinions = [](const std::string&) { return opinion_json("contratto nullo", 0.6); };

    auto ans = orchestrator->handle_query(query("Domanda", "validità_atto", 0.4), EnrichedContext{});
    ASSERT_EQ(ans.contributions.size(), 2u);
    EXPECT_NEAR(ans.contributions[0].gating_weight, config.gating.priors[index_of(ExpertId::Literal)], 1e-9);
    EXPECT_NEAR(ans.contributions[1].gating_weight, config.gating.priors[index_of(ExpertId::Precedent)], 1e-9);
}

TEST_F(OrchestratorTest, FeedbackOnAnsweredQueryUpdatesGate) {
    plans = {plan_json({"literal"})};
    opinions = [](const std::string&) { return opinion_json("Il contratto è annullabile", 0.8); };
    orchestrator->handle_query(query("Il contratto del minore è valido?", "validità_atto", 0.3), EnrichedContext{});

    auto gating = orchestrator->components().gating;
    auto version = gating->version();

    FeedbackRecord r;
    r.feedback_id = "fb-1";
    r.user_id = "mag.bianchi";
    r.trace_id = "t-validità_atto";
    r.rating = 5;
    r.expert_correctness = {{ExpertId::Literal, true}};

    auto out = orchestrator->handle_feedback(r);
    EXPECT_TRUE(out.accepted);
    EXPECT_TRUE(out.gating_updated);
    EXPECT_EQ(gating->version(), version + 1);

    r.feedback_id = "fb-2";
    r.user_id = "sconosciuto";
    EXPECT_EQ(orchestrator->handle_feedback(r).rejection, FeedbackRejection::UnknownUser);
}

TEST(RefinementNotesTest, ListsWeakExperts) {
    SynthesizedAnswer ans;
    ans.iterations = 1;
    ans.confidence = 0.4;
    auto op = ExpertOpinion::degraded(ExpertId::Precedent, kLimitTimedOut, "deadline");
    ans.opinions = {op};

    auto notes = Orchestrator::refinement_notes(ans, 0.7);
    EXPECT_NE(notes.find("below the required 0.70"), std::string::npos);
    EXPECT_NE(notes.find("precedent"), std::string::npos);
    EXPECT_NE(notes.find(kLimitTimedOut), std::string::npos);
}
