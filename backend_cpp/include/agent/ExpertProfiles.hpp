#pragma once
#include <vector>
#include "agent/ExpertTypes.hpp"

namespace merlt {

// Built-in profile for each reasoning expert.
const ExpertProfile& profile_for(ExpertId id);
std::vector<ExpertProfile> default_profiles();

} // namespace merlt
