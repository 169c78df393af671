#include "feedback_processor.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "SystemMonitor.hpp"

namespace merlt {

FeedbackProcessor::FeedbackProcessor(Dependencies deps, const FeedbackSettings& settings, const TraversalSettings& traversal)
    : deps_(std::move(deps)), settings_(settings), traversal_lr_(traversal.learning_rate) {
    if (!deps_.gating || !deps_.traversal || !deps_.authority || !deps_.idempotence) {
        throw std::invalid_argument("FeedbackProcessor requires gating, traversal, authority and idempotence components");
    }
}

GatingWeights FeedbackProcessor::build_target(const GatingWeights& current,
                                              const std::map<ExpertId, bool>& correctness,
                                              double smoothing) {
    GatingWeights t = current;
    for (const auto& [id, ok] : correctness) t[index_of(id)] = ok ? 1.0 : 0.0;

    double eps = std::clamp(smoothing, 0.0, 1.0);
    double sum = 0.0;
    for (auto& v : t) {
        v = (1.0 - eps) * v + eps / static_cast<double>(kExpertCount);
        sum += v;
    }
    for (auto& v : t) v = sum > 0.0 ? v / sum : 1.0 / static_cast<double>(kExpertCount);
    return t;
}

int FeedbackProcessor::pending(const std::string& weight_set) const {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto it = counters_.find(weight_set);
    return it != counters_.end() ? it->second : 0;
}

void FeedbackProcessor::count_towards_rollout(const std::string& weight_set, uint64_t version, FeedbackOutcome& out) {
    int& count = counters_[weight_set];
    if (++count < settings_.rollout_threshold) return;
    count = 0;

    std::string candidate = weight_set + "@v" + std::to_string(version);
    out.candidates.push_back(candidate);
    SystemMonitor::global_rollout_candidates++;
    spdlog::info("🚀 Rollout candidate ready: {}", candidate);
    if (!deps_.rollout) return;
    try {
        deps_.rollout->candidate_ready(candidate);
    } catch (const std::exception& e) {
        spdlog::error("💥 Rollout controller rejected {}: {}", candidate, e.what());
    }
}

bool FeedbackProcessor::apply_gating(const FeedbackRecord& record, double authority, FeedbackOutcome& out) {
    if (record.expert_correctness.empty()) return false;

    std::vector<float> embedding = record.query_embedding;
    if (embedding.empty() && deps_.traces && !record.trace_id.empty()) {
        if (auto trace = deps_.traces->find(record.trace_id)) embedding = trace->query_embedding;
    }
    if (embedding.empty()) {
        spdlog::warn("Feedback {}: no query embedding for trace '{}', gate not updated",
                     record.feedback_id, record.trace_id);
        return false;
    }
    if (embedding.size() != deps_.gating->input_dim()) {
        spdlog::warn("Feedback {}: embedding has {} dimensions, gate expects {}; gate not updated",
                     record.feedback_id, embedding.size(), deps_.gating->input_dim());
        return false;
    }

    auto current = deps_.gating->route(embedding);
    auto target = build_target(current, record.expert_correctness, settings_.label_smoothing);
    auto after = deps_.gating->update(embedding, target, authority);

    spdlog::info("🎛️ Gate updated by {} (authority {:.2f}): literal {:.3f}->{:.3f}, systemic {:.3f}->{:.3f}, "
                 "principles {:.3f}->{:.3f}, precedent {:.3f}->{:.3f}",
                 record.feedback_id, authority,
                 current[0], after[0], current[1], after[1], current[2], after[2], current[3], after[3]);
    count_towards_rollout(kGatingSet, deps_.gating->version(), out);
    return true;
}

void FeedbackProcessor::apply_traversal(const FeedbackRecord& record, double authority, FeedbackOutcome& out) {
    double step = traversal_lr_ * authority;
    for (const auto& [expert, relations] : record.relation_usefulness) {
        std::map<std::string, double> deltas;
        for (const auto& [rel, useful] : relations) deltas[rel] = useful ? step : -step;

        int changed = deps_.traversal->update(expert, deltas);
        if (changed == 0) continue;
        out.traversal_updates += changed;
        count_towards_rollout(traversal_set(expert), deps_.traversal->version(expert), out);
    }
}

FeedbackOutcome FeedbackProcessor::ingest(const FeedbackRecord& record) {
    std::lock_guard<std::mutex> lock(writer_mutex_);

    if (record.feedback_id.empty() || record.user_id.empty()) {
        SystemMonitor::global_feedback_rejected++;
        spdlog::warn("Feedback rejected: missing feedback_id or user_id");
        return FeedbackOutcome::rejected(FeedbackRejection::InvalidRecord, "feedback_id and user_id are required");
    }

    // Nothing is mutated until the id is claimed, so a failing store leaves the
    // record free to be redelivered and applied exactly once.
    std::optional<double> authority;
    try {
        if (deps_.idempotence->has_processed(record.feedback_id)) {
            spdlog::info("Feedback {} already processed, ignoring", record.feedback_id);
            return FeedbackOutcome::rejected(FeedbackRejection::DuplicateFeedback, "already processed");
        }

        authority = deps_.authority->score(record.user_id);
        if (!authority) {
            SystemMonitor::global_feedback_rejected++;
            return FeedbackOutcome::rejected(FeedbackRejection::UnknownUser, "unknown user '" + record.user_id + "'");
        }

        deps_.idempotence->mark_processed(record.feedback_id);
    } catch (const std::exception& e) {
        SystemMonitor::global_feedback_rejected++;
        spdlog::error("💥 Feedback {} not applied, store unavailable: {}", record.feedback_id, e.what());
        return FeedbackOutcome::rejected(FeedbackRejection::StoreUnavailable, e.what());
    }

    if (record.authority_score && std::fabs(*record.authority_score - *authority) > 1e-6) {
        spdlog::debug("Feedback {}: claimed authority {:.3f}, computed {:.3f}",
                      record.feedback_id, *record.authority_score, *authority);
    }

    FeedbackOutcome out;
    out.accepted = true;
    out.authority = *authority;

    if (*authority < settings_.min_authority) {
        out.reason = "authority below threshold, archived without update";
        spdlog::info("Feedback {}: authority {:.2f} below {:.2f}, no update",
                     record.feedback_id, *authority, settings_.min_authority);
    } else if (*authority > 0.0) {
        out.gating_updated = apply_gating(record, *authority, out);
        apply_traversal(record, *authority, out);
    }

    if (deps_.archive) {
        try {
            deps_.archive->archive(record, *authority);
        } catch (const std::exception& e) {
            spdlog::error("💥 Feedback {} applied but not archived: {}", record.feedback_id, e.what());
            out.reason = std::string("archive failed: ") + e.what();
        }
    }
    SystemMonitor::global_feedback_applied++;

    spdlog::info("📝 Feedback {} applied: gate {}, {} relation updates, {} candidates",
                 record.feedback_id, out.gating_updated ? "updated" : "unchanged",
                 out.traversal_updates, out.candidates.size());
    return out;
}

} // namespace merlt
