#pragma once
#include <memory>
#include <optional>
#include <string>
#include "cache_manager.hpp"
#include "collaborators.hpp"
#include "config_manager.hpp"

namespace merlt {

// A_u = w_role * role(u) + w_acc * accuracy(u) + w_cons * consensus(u) + w_rep * reputation(u),
// clamped to [0,1]. Scores are cached read-through; the user store stays the source of truth.
class AuthorityScorer {
public:
    AuthorityScorer(std::shared_ptr<UserStore> users, const AuthoritySettings& settings);

    // nullopt when the user store does not know the user.
    std::optional<double> score(const std::string& user_id);

    double compute(const UserProfile& profile) const;
    double role_score(const std::string& role) const;

    void invalidate(const std::string& user_id) { cache_.invalidate_authority(user_id); }
    const CacheManager& cache() const { return cache_; }

private:
    std::shared_ptr<UserStore> users_;
    AuthoritySettings settings_;
    CacheManager cache_;
};

} // namespace merlt
