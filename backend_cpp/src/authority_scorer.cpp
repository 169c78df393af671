#include "authority_scorer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace merlt {

AuthorityScorer::AuthorityScorer(std::shared_ptr<UserStore> users, const AuthoritySettings& settings)
    : users_(std::move(users)),
      settings_(settings),
      cache_(settings.cache_size, std::chrono::seconds(settings.cache_ttl_seconds)) {
    if (!users_) throw std::invalid_argument("AuthorityScorer requires a user store");
}

double AuthorityScorer::role_score(const std::string& role) const {
    std::string r = role;
    std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = settings_.roles.find(r);
    return it != settings_.roles.end() ? it->second : settings_.default_role_score;
}

double AuthorityScorer::compute(const UserProfile& profile) const {
    auto unit = [](double v) { return std::isfinite(v) ? std::clamp(v, 0.0, 1.0) : 0.0; };

    double score = settings_.role_weight * unit(role_score(profile.role)) +
                   settings_.accuracy_weight * unit(profile.history.accuracy) +
                   settings_.consensus_weight * unit(profile.history.consensus) +
                   settings_.reputation_weight * unit(profile.history.reputation);
    return unit(score);
}

std::optional<double> AuthorityScorer::score(const std::string& user_id) {
    if (auto cached = cache_.get_authority(user_id)) return cached;

    auto profile = users_->get_user_profile(user_id);
    if (!profile) {
        spdlog::warn("👤 Unknown user '{}', no authority score", user_id);
        return std::nullopt;
    }

    double a = compute(*profile);
    cache_.set_authority(user_id, a);
    spdlog::debug("Authority for {} ({}): {:.3f}", user_id, profile->role, a);
    return a;
}

} // namespace merlt
