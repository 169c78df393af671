#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "collaborators.hpp"
#include "config_manager.hpp"
#include "legal_types.hpp"

namespace merlt {

// Agreement between two expert conclusions, in [0,1].
class AgreementScorer {
public:
    virtual ~AgreementScorer() = default;
    virtual double agreement(const std::string& a, const std::string& b) = 0;
};

// Token-set Jaccard over lower-cased words of three or more letters.
class LexicalAgreementScorer : public AgreementScorer {
public:
    double agreement(const std::string& a, const std::string& b) override;
};

// Cosine similarity of conclusion embeddings, clamped to [0,1]. Falls back to
// the lexical scorer when the embedding call fails.
class EmbeddingAgreementScorer : public AgreementScorer {
public:
    explicit EmbeddingAgreementScorer(std::shared_ptr<EmbeddingClient> embedder);
    double agreement(const std::string& a, const std::string& b) override;

    static double cosine(const std::vector<float>& a, const std::vector<float>& b);

private:
    std::shared_ptr<EmbeddingClient> embedder_;
    LexicalAgreementScorer fallback_;
};

struct ModeDecision {
    SynthesisMode mode = SynthesisMode::Convergent;
    double min_agreement = 1.0;
};

class Synthesizer {
public:
    Synthesizer(std::shared_ptr<AgreementScorer> scorer, SynthesizerSettings settings);

    // Pairwise agreement over the usable opinions. A single opinion agrees with itself.
    ModeDecision determine_mode(const std::vector<ExpertOpinion>& opinions) const;

    // Throws InsufficientEvidence when no opinion is usable.
    SynthesizedAnswer synthesize(const std::vector<ExpertOpinion>& opinions,
                                 const GatingWeights& gating,
                                 const std::string& trace_id = "",
                                 int iteration = 1) const;

    // Gating weights restricted to the usable opinions and renormalised (uniform if all zero).
    static std::vector<std::pair<const ExpertOpinion*, double>> renormalize(
        const std::vector<ExpertOpinion>& opinions, const GatingWeights& gating);

private:
    std::shared_ptr<AgreementScorer> scorer_;
    SynthesizerSettings settings_;

    std::string compose_convergent(const std::vector<std::pair<const ExpertOpinion*, double>>& weighted) const;
    std::string compose_divergent(const std::vector<std::pair<const ExpertOpinion*, double>>& weighted,
                                  double min_agreement) const;
};

} // namespace merlt
