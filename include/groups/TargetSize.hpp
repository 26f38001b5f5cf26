#pragma once
#include <vector>

#include "groups/FormationConfig.hpp"
#include "groups/Models.hpp"

namespace groups {

// Median of the clamped preferences (even count: integer part of the mean of
// the two middle values), clamped again. Empty roster -> fallback size.
int resolve_target_size(const std::vector<Student>& students, const FormationConfig& cfg = {});

}  // namespace groups
