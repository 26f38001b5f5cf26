#pragma once
#include <set>
#include <string>
#include <vector>

namespace groups {

using StudentId = long long;
using CourseId = long long;
using TimeSlotId = long long;
using GroupId = long long;

struct Student {
    StudentId id = 0;
    std::string name;
    std::string email;
    int preferred_group_size = 3;        // clamped at the boundary, 2..5
    std::vector<CourseId> course_ids;    // enrollment order
    std::set<TimeSlotId> availability;
};

struct Course {
    CourseId id = 0;
    std::string code;                    // CS101
    std::string name;
};

struct TimeSlot {
    TimeSlotId id = 0;
    std::string label;                   // "Mon 10-12"
    std::string day_of_week;
    std::string start_time;
    std::string end_time;
};

// Students enrolled in one course. Roster order drives every tie-break.
struct CourseRoster {
    CourseId course_id = 0;
    std::vector<Student> students;
};

using Group = std::vector<Student>;

}  // namespace groups
