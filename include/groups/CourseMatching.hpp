#pragma once

#include <atomic>
#include <stdexcept>
#include <vector>

#include "groups/FormationConfig.hpp"
#include "groups/GroupFormation.hpp"
#include "groups/Models.hpp"
#include "store/Store.hpp"

namespace groups {

// Thrown when run_matching() is called while another run is still in flight.
class MatchingInProgress : public std::runtime_error {
public:
    MatchingInProgress() : std::runtime_error("a matching run is already in progress") {}
};

struct CourseGroups {
    CourseId course_id = 0;
    int target_size = 0;
    std::vector<std::vector<StudentId>> groups;   // formation order; group_index = position + 1
    std::vector<GroupId> group_ids;               // as returned by the sink, parallel to groups
    std::vector<FormationStep> steps;
};

struct MatchingResult {
    std::vector<CourseGroups> courses;            // course iteration order of the provider

    bool empty() const { return courses.empty(); }
    const CourseGroups* find(CourseId course_id) const;
};

// Runs group formation for every course and replaces all persisted groups.
class CourseMatcher {
public:
    CourseMatcher(store::RosterProvider& rosters, store::ResultSink& sink, FormationConfig cfg = {});

    // Forms every course's groups first, then clears and rewrites all groups in
    // one staged replace. Storage failures roll the replace back and propagate.
    MatchingResult run_matching();

    const FormationConfig& config() const { return m_cfg; }

private:
    store::RosterProvider& m_rosters;
    store::ResultSink& m_sink;
    FormationConfig m_cfg;

    std::atomic<bool> m_running{false};
};

}  // namespace groups
