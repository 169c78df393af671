#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <thread>

#include "orchestrator_service.hpp"
#include "agent/ExpertProfiles.hpp"
#include "config_manager.hpp"
#include "faiss_vector_store.hpp"
#include "KeyManager.hpp"
#include "llm_service.hpp"
#include "memory/FeedbackVault.hpp"
#include "memory/LocalStores.hpp"
#include "rollout_client.hpp"
#include "tools/RetrievalTools.hpp"

namespace fs = std::filesystem;
using grpc::Server;
using grpc::ServerBuilder;

namespace {
std::atomic<bool> g_shutdown{false};

void on_signal(int) { g_shutdown.store(true); }

struct Args {
    std::string config;
    std::string keys;
};

Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i + 1 < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--config") a.config = argv[++i];
        else if (flag == "--keys") a.keys = argv[++i];
    }
    return a;
}
}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    auto args = parse_args(argc, argv);

    // 1. Configuration
    auto config_mgr = std::make_shared<merlt::ConfigManager>(args.config);
    auto cfg = config_mgr->snapshot();
    spdlog::set_level(spdlog::level::from_str(cfg->log_level));

    // 2. Provider clients
    auto keys = std::make_shared<merlt::KeyManager>(args.keys);
    auto cache = std::make_shared<merlt::CacheManager>(cfg->authority.cache_size,
                                                       std::chrono::seconds(cfg->authority.cache_ttl_seconds));
    auto llm = std::make_shared<merlt::LlmService>(keys, cfg->llm, cache);

    // 3. Knowledge store
    auto store = std::make_shared<merlt::FaissKnowledgeStore>(static_cast<int>(cfg->gating.input_dim), llm);
    if (fs::exists(fs::path(cfg->index_dir) / "faiss.index")) {
        try {
            store->load(cfg->index_dir);
        } catch (const std::exception& e) {
            spdlog::error("💥 Could not load index from {}: {}", cfg->index_dir, e.what());
            return 1;
        }
    } else {
        spdlog::warn("⚠️ No index in {}, retrieval will return nothing", cfg->index_dir);
    }

    // 4. Learned weights
    fs::path weights_dir(cfg->weights_dir);
    auto gating = std::make_shared<merlt::GatingNetwork>(cfg->gating);
    auto traversal = std::make_shared<merlt::TraversalWeightStore>(cfg->traversal);
    gating->load((weights_dir / "gating.json").string());
    traversal->load((weights_dir / "traversal.json").string());

    // 5. Tools and experts
    auto engine = std::make_shared<merlt::RetrievalEngine>(store, traversal);
    auto tools = std::make_shared<merlt::ToolRegistry>();
    merlt::register_retrieval_tools(*tools, engine);

    std::vector<std::shared_ptr<merlt::ReasoningExpert>> experts;
    for (const auto& profile : merlt::default_profiles()) {
        experts.push_back(std::make_shared<merlt::ReasoningExpert>(profile, llm, tools, cfg->experts));
    }
    auto pool = std::make_shared<merlt::ExpertPool>(experts, cfg->experts);

    // 6. Learning loop
    auto traces = std::make_shared<merlt::LogManager>(cfg->orchestrator.trace_capacity);
    auto users = std::make_shared<merlt::JsonUserStore>(cfg->users_path);
    merlt::FeedbackProcessor::Dependencies deps;
    deps.gating = gating;
    deps.traversal = traversal;
    deps.authority = std::make_shared<merlt::AuthorityScorer>(users, cfg->authority);
    deps.idempotence = std::make_shared<merlt::InMemoryIdempotenceStore>();
    deps.archive = std::make_shared<merlt::FeedbackVault>((weights_dir / "feedback.jsonl").string());
    deps.rollout = std::make_shared<merlt::HttpRolloutController>(cfg->rollout_endpoint);
    deps.traces = traces;
    auto feedback = std::make_shared<merlt::FeedbackProcessor>(deps, cfg->feedback, cfg->traversal);

    // 7. Orchestrator
    merlt::Orchestrator::Components components;
    components.router = std::make_shared<merlt::PlanRouter>(llm, cfg->router);
    components.gating = gating;
    components.experts = pool;
    components.synthesizer = std::make_shared<merlt::Synthesizer>(
        std::make_shared<merlt::EmbeddingAgreementScorer>(llm), cfg->synthesizer);
    components.feedback = feedback;
    components.embedder = llm;
    components.traces = traces;
    auto orchestrator = std::make_shared<merlt::Orchestrator>(components, cfg->orchestrator);

    merlt::OrchestratorServiceImpl service(orchestrator, traversal);

    // 8. Start gRPC Server
    ServerBuilder builder;
    builder.AddListeningPort(cfg->listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::critical("💥 Could not listen on {}", cfg->listen_address);
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::thread watcher([&server]() {
        while (!g_shutdown.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
        spdlog::info("🛑 Shutdown requested");
        server->Shutdown();
    });

    spdlog::info("🚀 MERL-T orchestrator listening on {}", cfg->listen_address);
    server->Wait();
    g_shutdown.store(true);
    watcher.join();

    // Persist what the feedback loop learned
    try {
        gating->save((weights_dir / "gating.json").string());
        traversal->save((weights_dir / "traversal.json").string());
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to persist weights: {}", e.what());
        return 1;
    }
    return 0;
}
