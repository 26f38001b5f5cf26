#include "groups/CourseMatching.hpp"

namespace groups {

namespace {

// Clears the in-flight flag when a run ends, however it ends.
class RunningFlag {
public:
    explicit RunningFlag(std::atomic<bool>& flag) : m_flag(flag) {}
    ~RunningFlag() { m_flag = false; }

    RunningFlag(const RunningFlag&) = delete;
    RunningFlag& operator=(const RunningFlag&) = delete;

private:
    std::atomic<bool>& m_flag;
};

}  // namespace

const CourseGroups* MatchingResult::find(CourseId course_id) const {
    for (const auto& c : courses) {
        if (c.course_id == course_id) return &c;
    }
    return nullptr;
}

CourseMatcher::CourseMatcher(store::RosterProvider& rosters, store::ResultSink& sink, FormationConfig cfg)
    : m_rosters(rosters), m_sink(sink), m_cfg(cfg) {}

MatchingResult CourseMatcher::run_matching() {
    if (m_running.exchange(true)) throw MatchingInProgress();
    RunningFlag running(m_running);

    MatchingResult res;

    const std::vector<CourseRoster> rosters = m_rosters.load_rosters();
    for (const auto& roster : rosters) {
        if (roster.students.empty()) continue;

        FormationResult formed = form_groups_detailed(roster.students, m_cfg);

        CourseGroups cg;
        cg.course_id = roster.course_id;
        cg.target_size = formed.target_size;
        cg.steps = std::move(formed.steps);
        cg.groups.reserve(formed.groups.size());
        for (const auto& g : formed.groups) {
            std::vector<StudentId> ids;
            ids.reserve(g.size());
            for (const auto& s : g) ids.push_back(s.id);
            cg.groups.push_back(std::move(ids));
        }
        res.courses.push_back(std::move(cg));
    }

    if (res.empty()) return res;

    m_sink.begin_replace();
    try {
        m_sink.clear_all_groups();
        for (auto& cg : res.courses) {
            cg.group_ids.reserve(cg.groups.size());
            for (size_t i = 0; i < cg.groups.size(); ++i) {
                const int group_index = static_cast<int>(i) + 1;
                cg.group_ids.push_back(m_sink.write_group(cg.course_id, group_index, cg.groups[i]));
            }
        }
        m_sink.commit_replace();
    } catch (...) {
        m_sink.rollback_replace();
        throw;
    }

    return res;
}

}  // namespace groups
