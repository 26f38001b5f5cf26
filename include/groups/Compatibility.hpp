#pragma once
#include <cstddef>
#include <vector>

#include "groups/FormationConfig.hpp"
#include "groups/Models.hpp"

namespace groups {

// base + shared time slots - (sizeDiff - 1) when sizeDiff >= 2, never below 0
int compatibility(const Student& a, const Student& b, const FormationConfig& cfg = {});

// Pairwise scores for one roster, indexed by roster position.
class CompatibilityMatrix {
public:
    static CompatibilityMatrix build(const std::vector<Student>& students, const FormationConfig& cfg = {});

    int at(size_t i, size_t j) const { return m_scores[i * m_n + j]; }
    size_t size() const { return m_n; }

private:
    size_t m_n = 0;
    std::vector<int> m_scores; // packed: size = n*n, diagonal 0
};

}  // namespace groups
