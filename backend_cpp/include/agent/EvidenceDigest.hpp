#pragma once
#include <string>
#include <vector>
#include "retrieval_engine.hpp"

namespace merlt {

class EvidenceDigest {
public:
    explicit EvidenceDigest(size_t max_chars = 24000) : max_chars_(max_chars) {}

    /**
     * Renders collected evidence in three tiers, best score first:
     * full text for the top items, an excerpt for the next ones, and a
     * one-line reference for the rest.
     */
    std::string render(const std::vector<WeightedEvidence>& evidence) const;

    // Sorted by score and de-duplicated by URN (or id), keeping the best hit.
    static std::vector<WeightedEvidence> consolidate(const std::vector<WeightedEvidence>& evidence);

private:
    size_t max_chars_;

    static std::string excerpt(const std::string& text, size_t max_bytes);
};

} // namespace merlt
