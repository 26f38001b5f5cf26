#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "groups/Models.hpp"

namespace store {

// Any failure of the backing storage. Never masked by the matcher.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything a store holds apart from the groups themselves.
struct Dataset {
    std::vector<groups::Course> courses;
    std::vector<groups::TimeSlot> timeslots;
    std::vector<groups::Student> students;
};

struct MemberView {
    groups::StudentId id = 0;
    std::string name;
    std::string email;
};

struct GroupView {
    groups::GroupId group_id = 0;
    groups::CourseId course_id = 0;
    std::string course_code;
    std::string course_name;
    int group_index = 0;
    std::vector<MemberView> members;   // ordered by name
};

class RosterProvider {
public:
    virtual ~RosterProvider() = default;

    // One roster per course with at least one enrolled student, in a stable order.
    virtual std::vector<groups::CourseRoster> load_rosters() = 0;
};

// Receives a full replacement of every course's groups:
//   begin_replace, clear_all_groups, write_group..., commit_replace
// Nothing is visible to readers until commit_replace; rollback_replace
// discards the staged work and must not throw.
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void begin_replace() = 0;
    virtual void clear_all_groups() = 0;
    virtual groups::GroupId write_group(groups::CourseId course_id,
                                        int group_index,
                                        const std::vector<groups::StudentId>& member_ids) = 0;
    virtual void commit_replace() = 0;
    virtual void rollback_replace() = 0;
};

// Read side used by presentation: ordered by course code, group index, member name.
class GroupQuery {
public:
    virtual ~GroupQuery() = default;

    virtual std::vector<GroupView> list_groups() = 0;
};

}  // namespace store
