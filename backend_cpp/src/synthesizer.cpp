#include "synthesizer.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <set>
#include <sstream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "orchestrator_errors.hpp"
#include "SystemMonitor.hpp"

namespace merlt {

namespace {

std::set<std::string> word_set(const std::string& text) {
    std::set<std::string> words;
    std::string cur;
    auto flush = [&]() {
        if (cur.size() >= 3) words.insert(cur);
        cur.clear();
    };
    for (unsigned char c : text) {
        // Bytes >= 0x80 belong to accented letters and stay inside the word.
        if (std::isalnum(c) || c >= 0x80) cur += static_cast<char>(std::tolower(c));
        else flush();
    }
    flush();
    return words;
}

std::string section_title(ExpertId id) {
    switch (id) {
        case ExpertId::Literal: return "Literal interpretation";
        case ExpertId::Systemic: return "Systemic and teleological interpretation";
        case ExpertId::Principles: return "Constitutional principles";
        case ExpertId::Precedent: return "Case law";
    }
    return "Interpretation";
}

}

// --- Scorers ---

double LexicalAgreementScorer::agreement(const std::string& a, const std::string& b) {
    auto wa = word_set(a);
    auto wb = word_set(b);
    if (wa.empty() && wb.empty()) return 1.0;
    if (wa.empty() || wb.empty()) return 0.0;

    size_t common = 0;
    for (const auto& w : wa) common += wb.count(w);
    size_t uni = wa.size() + wb.size() - common;
    return static_cast<double>(common) / static_cast<double>(uni);
}

EmbeddingAgreementScorer::EmbeddingAgreementScorer(std::shared_ptr<EmbeddingClient> embedder)
    : embedder_(std::move(embedder)) {}

double EmbeddingAgreementScorer::cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    double c = dot / (std::sqrt(na) * std::sqrt(nb));
    return std::isfinite(c) ? std::clamp(c, 0.0, 1.0) : 0.0;
}

double EmbeddingAgreementScorer::agreement(const std::string& a, const std::string& b) {
    if (!embedder_) return fallback_.agreement(a, b);
    try {
        auto ea = embedder_->embed(a);
        auto eb = embedder_->embed(b);
        if (ea.empty() || ea.size() != eb.size()) {
            spdlog::warn("Agreement: unusable embeddings ({} vs {} dims), using lexical overlap", ea.size(), eb.size());
            return fallback_.agreement(a, b);
        }
        return cosine(ea, eb);
    } catch (const std::exception& e) {
        spdlog::warn("Agreement: embedding failed ({}), using lexical overlap", e.what());
        return fallback_.agreement(a, b);
    }
}

// --- Synthesizer ---

Synthesizer::Synthesizer(std::shared_ptr<AgreementScorer> scorer, SynthesizerSettings settings)
    : scorer_(std::move(scorer)), settings_(settings) {
    if (!scorer_) scorer_ = std::make_shared<LexicalAgreementScorer>();
}

ModeDecision Synthesizer::determine_mode(const std::vector<ExpertOpinion>& opinions) const {
    std::vector<const ExpertOpinion*> usable;
    for (const auto& op : opinions) {
        if (op.usable()) usable.push_back(&op);
    }

    ModeDecision d;
    for (size_t i = 0; i < usable.size(); ++i) {
        for (size_t j = i + 1; j < usable.size(); ++j) {
            double a = scorer_->agreement(usable[i]->conclusion(), usable[j]->conclusion());
            if (!std::isfinite(a)) a = 0.0;
            d.min_agreement = std::min(d.min_agreement, std::clamp(a, 0.0, 1.0));
        }
    }
    d.mode = d.min_agreement >= settings_.agreement_threshold ? SynthesisMode::Convergent : SynthesisMode::Divergent;
    return d;
}

std::vector<std::pair<const ExpertOpinion*, double>> Synthesizer::renormalize(
    const std::vector<ExpertOpinion>& opinions, const GatingWeights& gating) {
    std::vector<std::pair<const ExpertOpinion*, double>> out;
    double total = 0.0;
    for (const auto& op : opinions) {
        if (!op.usable()) continue;
        double w = gating[index_of(op.expert)];
        if (!std::isfinite(w) || w < 0.0) w = 0.0;
        out.emplace_back(&op, w);
        total += w;
    }
    for (auto& [op, w] : out) {
        w = total > 0.0 ? w / total : 1.0 / static_cast<double>(out.size());
    }
    return out;
}

std::string Synthesizer::compose_convergent(const std::vector<std::pair<const ExpertOpinion*, double>>& weighted) const {
    auto ordered = weighted;
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return index_of(a.first->expert) < index_of(b.first->expert);
    });

    std::stringstream out;
    out << "The interpretive approaches converge.\n";
    for (const auto& [op, w] : ordered) {
        out << "\n## " << section_title(op->expert) << "\n" << op->interpretation << "\n";
        if (!op->sources.empty()) {
            out << "Sources:";
            for (size_t i = 0; i < op->sources.size() && i < 5; ++i) out << " " << op->sources[i].source_id;
            out << "\n";
        }
    }
    return out.str();
}

std::string Synthesizer::compose_divergent(const std::vector<std::pair<const ExpertOpinion*, double>>& weighted,
                                           double min_agreement) const {
    auto ordered = weighted;
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    std::stringstream out;
    out << fmt::format("The interpretive approaches diverge (minimum agreement {:.2f}). "
                       "The {} reading carries the most weight ({:.2f}).\n",
                       min_agreement, to_string(ordered.front().first->expert), ordered.front().second);
    for (const auto& [op, w] : ordered) {
        out << fmt::format("\n## {} (weight {:.2f}, confidence {:.2f})\n", section_title(op->expert), w, op->confidence)
            << op->interpretation << "\n";
    }
    return out.str();
}

SynthesizedAnswer Synthesizer::synthesize(const std::vector<ExpertOpinion>& opinions,
                                          const GatingWeights& gating,
                                          const std::string& trace_id,
                                          int iteration) const {
    auto start = std::chrono::high_resolution_clock::now();

    auto weighted = renormalize(opinions, gating);
    if (weighted.empty()) {
        spdlog::error("🕳️ [{}] No usable expert opinion out of {}", trace_id, opinions.size());
        InsufficientEvidence err(iteration, "no usable expert opinion out of " + std::to_string(opinions.size()));
        err.set_trace_id(trace_id);
        throw err;
    }

    auto decision = determine_mode(opinions);

    SynthesizedAnswer ans;
    ans.trace_id = trace_id;
    ans.mode = decision.mode;
    ans.min_agreement = decision.min_agreement;
    ans.iterations = iteration;
    ans.opinions = opinions;

    double weighted_conf = 0.0;
    for (const auto& op : opinions) {
        ExpertContribution c;
        c.expert = op.expert;
        c.gating_weight = gating[index_of(op.expert)];
        c.confidence = op.confidence;
        for (const auto& [wop, w] : weighted) {
            if (wop == &op) {
                c.included = true;
                c.normalized_weight = w;
                c.weighted_confidence = w * op.confidence;
            }
        }
        weighted_conf += c.weighted_confidence;
        ans.contributions.push_back(c);
    }

    if (decision.mode == SynthesisMode::Convergent) {
        ans.text = compose_convergent(weighted);
        ans.confidence = weighted_conf;
    } else {
        double spread = 1.0 - decision.min_agreement;
        ans.text = compose_divergent(weighted, decision.min_agreement);
        ans.confidence = weighted_conf * (1.0 - spread);
        auto top = std::max_element(weighted.begin(), weighted.end(), [](const auto& a, const auto& b) {
            return a.second < b.second;
        });
        ans.favoured_expert = top->first->expert;
    }
    ans.confidence = std::clamp(ans.confidence, 0.0, 1.0);

    auto end = std::chrono::high_resolution_clock::now();
    SystemMonitor::global_synthesis_latency_ms.store(std::chrono::duration<double, std::milli>(end - start).count());
    spdlog::info("🧩 [{}] Synthesis: {} (min agreement {:.2f}), confidence {:.3f}, {} of {} opinions used",
                 trace_id, to_string(ans.mode), ans.min_agreement, ans.confidence, weighted.size(), opinions.size());
    return ans;
}

} // namespace merlt
