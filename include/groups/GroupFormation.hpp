#pragma once

#include <string>
#include <vector>

#include "groups/FormationConfig.hpp"
#include "groups/Models.hpp"

namespace groups {

enum class StepKind {
    Seed,
    Grow,
    Merge
};

// One decision taken while forming a course's groups.
struct FormationStep {
    StepKind kind = StepKind::Seed;
    StudentId student_id = 0;

    // 0-based position of the group the student went into (formation order)
    int group_position = 0;

    // Seed: sum of scores against the other unassigned students.
    // Grow/Merge: average score against the group's members at that moment.
    double score = 0.0;
};

struct FormationResult {
    int target_size = 0;               // 0 when the roster had fewer than 2 students
    std::vector<Group> groups;         // formation order, members in insertion order
    std::vector<FormationStep> steps;
};

const char* step_kind_str(StepKind k);

// Greedy seed-and-grow over one course roster, followed by merging a trailing
// singleton into its most compatible group. Ties go to the earliest candidate
// in roster order (groups: formation order).
FormationResult form_groups_detailed(const std::vector<Student>& students, const FormationConfig& cfg = {});

std::vector<Group> form_groups(const std::vector<Student>& students, const FormationConfig& cfg = {});

}  // namespace groups
