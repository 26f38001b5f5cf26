#include "groups/Compatibility.hpp"

#include <algorithm>
#include <cstdlib>

namespace groups {

static int shared_slot_count(const std::set<TimeSlotId>& a, const std::set<TimeSlotId>& b) {
    int n = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++n;
            ++ia;
            ++ib;
        }
    }
    return n;
}

int compatibility(const Student& a, const Student& b, const FormationConfig& cfg) {
    const int overlap = shared_slot_count(a.availability, b.availability);

    const int size_diff = std::abs(a.preferred_group_size - b.preferred_group_size);
    const int penalty = (size_diff >= 2) ? size_diff - 1 : 0;

    return std::max(0, cfg.base_score + overlap - penalty);
}

CompatibilityMatrix CompatibilityMatrix::build(const std::vector<Student>& students, const FormationConfig& cfg) {
    CompatibilityMatrix m;
    m.m_n = students.size();
    m.m_scores.assign(m.m_n * m.m_n, 0);

    for (size_t i = 0; i < m.m_n; ++i) {
        for (size_t j = i + 1; j < m.m_n; ++j) {
            const int s = compatibility(students[i], students[j], cfg);
            m.m_scores[i * m.m_n + j] = s;
            m.m_scores[j * m.m_n + i] = s;
        }
    }
    return m;
}

}  // namespace groups
