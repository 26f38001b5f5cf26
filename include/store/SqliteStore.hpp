#pragma once

#include "store/Store.hpp"

#include <string>
#include <vector>

struct sqlite3;

namespace store {

// SQLite database holding students, courses, time slots and the persisted
// study groups. A replace runs inside one IMMEDIATE transaction.
class SqliteStore final : public RosterProvider, public ResultSink, public GroupQuery {
public:
    explicit SqliteStore(const std::string& path);   // ":memory:" works too
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Creates tables and indexes, seeds default courses and time slots. Idempotent.
    void init_schema();

    std::vector<groups::Course> list_courses();       // by code
    std::vector<groups::TimeSlot> list_timeslots();   // by day, start time
    std::vector<groups::Student> list_students();     // newest first

    // Insert, or update the student with the same (lowercased) email and
    // replace its enrollments and availability. Name and email are required;
    // the preferred size is clamped to 2..5. Returns the student id.
    groups::StudentId upsert_student(const groups::Student& input);

    std::vector<groups::CourseRoster> load_rosters() override;

    void begin_replace() override;
    void clear_all_groups() override;
    groups::GroupId write_group(groups::CourseId course_id,
                                int group_index,
                                const std::vector<groups::StudentId>& member_ids) override;
    void commit_replace() override;
    void rollback_replace() override;

    std::vector<GroupView> list_groups() override;

private:
    void exec(const std::string& sql);

    sqlite3* m_db = nullptr;
    bool m_in_replace = false;
};

}  // namespace store
