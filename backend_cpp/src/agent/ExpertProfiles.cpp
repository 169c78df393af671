#include "agent/ExpertProfiles.hpp"
#include <array>

namespace merlt {

namespace {

std::array<ExpertProfile, kExpertCount> build_profiles() {
    std::array<ExpertProfile, kExpertCount> p;

    p[index_of(ExpertId::Literal)] = {
        ExpertId::Literal,
        "Literal Interpretation Expert",
        "Interpret the question by the ordinary meaning of the words of the law (art. 12 disp. prel. c.c.). "
        "Quote the exact wording of the relevant provisions, resolve legal definitions and cross-references, "
        "and do not go beyond what the text supports.",
        {"semantic_search", "norm_lookup", "find_definitions", "traverse_relations"}
    };

    p[index_of(ExpertId::Systemic)] = {
        ExpertId::Systemic,
        "Systemic-Teleological Expert",
        "Interpret the provisions in the context of the legal system and of their purpose. "
        "Consider connected norms, amendments, repeals and derogations, and the historical evolution "
        "of the rule over the relevant time span.",
        {"semantic_search", "traverse_relations", "norm_history"}
    };

    p[index_of(ExpertId::Principles)] = {
        ExpertId::Principles,
        "Principles Balancing Expert",
        "Identify the constitutional and European principles at stake and balance them. "
        "State which principle prevails in the case at hand and on what grounds (proportionality, "
        "reasonableness, essential core of the right).",
        {"semantic_search", "traverse_relations", "find_principles"}
    };

    p[index_of(ExpertId::Precedent)] = {
        ExpertId::Precedent,
        "Jurisprudential Precedent Expert",
        "Answer from case law. Find the rulings that interpret or apply the relevant norms, "
        "distinguish consolidated orientations from isolated decisions, and note overruled precedents.",
        {"semantic_search", "find_citations", "traverse_relations"}
    };

    return p;
}

const std::array<ExpertProfile, kExpertCount>& profiles() {
    static const auto table = build_profiles();
    return table;
}

}

const ExpertProfile& profile_for(ExpertId id) {
    return profiles()[index_of(id)];
}

std::vector<ExpertProfile> default_profiles() {
    return {profiles().begin(), profiles().end()};
}

} // namespace merlt
