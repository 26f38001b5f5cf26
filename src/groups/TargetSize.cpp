#include "groups/TargetSize.hpp"

#include <algorithm>

namespace groups {

int resolve_target_size(const std::vector<Student>& students, const FormationConfig& cfg) {
    if (students.empty()) return clamp_group_size(cfg.fallback_group_size, cfg);

    std::vector<int> prefs;
    prefs.reserve(students.size());
    for (const auto& s : students) prefs.push_back(clamp_group_size(s.preferred_group_size, cfg));

    std::sort(prefs.begin(), prefs.end());

    const size_t mid = prefs.size() / 2;
    int median = prefs[mid];
    if (prefs.size() % 2 == 0) {
        // integer part of the mean; both values are positive
        median = (prefs[mid - 1] + prefs[mid]) / 2;
    }

    return clamp_group_size(median, cfg);
}

}  // namespace groups
