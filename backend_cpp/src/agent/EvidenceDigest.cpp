#include "agent/EvidenceDigest.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <fmt/format.h>

namespace merlt {

std::vector<WeightedEvidence> EvidenceDigest::consolidate(const std::vector<WeightedEvidence>& evidence) {
    std::unordered_map<std::string, size_t> best;
    std::vector<WeightedEvidence> out;
    for (const auto& e : evidence) {
        const std::string& key = e.urn.empty() ? e.id : e.urn;
        auto it = best.find(key);
        if (it == best.end()) {
            best[key] = out.size();
            out.push_back(e);
        } else if (e.score > out[it->second].score) {
            out[it->second] = e;
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.score > b.score; });
    return out;
}

std::string EvidenceDigest::excerpt(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + " [...]";
}

std::string EvidenceDigest::render(const std::vector<WeightedEvidence>& evidence) const {
    auto items = consolidate(evidence);
    if (items.empty()) return "(no evidence collected yet)\n";

    std::stringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        const auto& e = items[i];
        const std::string& ref = e.urn.empty() ? e.id : e.urn;

        // TIER 1: full text
        if (i < 3) {
            out << fmt::format("[PRIMARY] {} ({}, score {:.3f})\n", ref, e.relation, e.score)
                << e.text << "\n---\n";
        }
        // TIER 2: excerpt
        else if (i < 12) {
            out << fmt::format("[SUPPORTING] {} ({}, score {:.3f})\n", ref, e.relation, e.score)
                << "  " << excerpt(e.text, 400) << "\n";
        }
        // TIER 3: reference only
        else {
            out << fmt::format("[REFERENCE] {} ({}, {} hops)\n", ref, e.relation, e.hops);
        }

        if (static_cast<size_t>(out.tellp()) > max_chars_) break;
    }
    return out.str();
}

} // namespace merlt
