#include "store/MemoryStore.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

using groups::Course;
using groups::CourseId;
using groups::CourseRoster;
using groups::GroupId;
using groups::Student;
using groups::StudentId;

namespace store {

MemoryStore::MemoryStore(Dataset data) : m_data(std::move(data)) {
    std::unordered_set<StudentId> seen;
    for (const auto& s : m_data.students) {
        if (!seen.insert(s.id).second) {
            throw StorageError("duplicate student id: " + std::to_string(s.id));
        }
    }
}

std::vector<CourseRoster> MemoryStore::load_rosters() {
    // known courses first, then any course only seen through an enrollment
    std::vector<CourseId> order;
    for (const auto& c : m_data.courses) order.push_back(c.id);
    for (const auto& s : m_data.students) {
        for (CourseId cid : s.course_ids) {
            if (std::find(order.begin(), order.end(), cid) == order.end()) order.push_back(cid);
        }
    }

    std::vector<CourseRoster> out;
    for (CourseId cid : order) {
        CourseRoster r;
        r.course_id = cid;
        for (const auto& s : m_data.students) {
            if (std::find(s.course_ids.begin(), s.course_ids.end(), cid) != s.course_ids.end()) {
                r.students.push_back(s);
            }
        }
        if (!r.students.empty()) out.push_back(std::move(r));
    }
    return out;
}

void MemoryStore::begin_replace() {
    if (m_in_replace) throw StorageError("replace already in progress");
    m_staged = m_groups;
    m_staged_next_id = m_next_group_id;
    m_in_replace = true;
}

void MemoryStore::clear_all_groups() {
    if (!m_in_replace) throw StorageError("clear_all_groups outside of begin_replace/commit_replace");
    m_staged.clear();
}

GroupId MemoryStore::write_group(CourseId course_id, int group_index, const std::vector<StudentId>& member_ids) {
    if (!m_in_replace) throw StorageError("write_group outside of begin_replace/commit_replace");

    StoredGroup g;
    g.id = m_staged_next_id++;
    g.course_id = course_id;
    g.group_index = group_index;
    g.member_ids = member_ids;
    m_staged.push_back(std::move(g));
    return m_staged.back().id;
}

void MemoryStore::commit_replace() {
    if (!m_in_replace) throw StorageError("commit_replace without begin_replace");

    m_next_group_id = m_staged_next_id;
    m_groups = std::move(m_staged);
    m_staged.clear();
    m_in_replace = false;
}

void MemoryStore::rollback_replace() {
    m_staged.clear();
    m_in_replace = false;
}

std::vector<GroupView> MemoryStore::list_groups() {
    std::unordered_map<CourseId, const Course*> courses;
    for (const auto& c : m_data.courses) courses[c.id] = &c;

    std::unordered_map<StudentId, const Student*> students;
    for (const auto& s : m_data.students) students[s.id] = &s;

    std::vector<GroupView> out;
    out.reserve(m_groups.size());

    for (const auto& g : m_groups) {
        GroupView v;
        v.group_id = g.id;
        v.course_id = g.course_id;
        v.group_index = g.group_index;

        auto cit = courses.find(g.course_id);
        if (cit != courses.end()) {
            v.course_code = cit->second->code;
            v.course_name = cit->second->name;
        }

        for (StudentId sid : g.member_ids) {
            MemberView m;
            m.id = sid;
            auto sit = students.find(sid);
            if (sit != students.end()) {
                m.name = sit->second->name;
                m.email = sit->second->email;
            }
            v.members.push_back(std::move(m));
        }

        std::stable_sort(v.members.begin(), v.members.end(),
                         [](const MemberView& a, const MemberView& b) { return a.name < b.name; });

        out.push_back(std::move(v));
    }

    std::stable_sort(out.begin(), out.end(), [](const GroupView& a, const GroupView& b) {
        if (a.course_code != b.course_code) return a.course_code < b.course_code;
        return a.group_index < b.group_index;
    });

    return out;
}

}  // namespace store
