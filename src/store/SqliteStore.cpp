#include "store/SqliteStore.hpp"

#include "groups/FormationConfig.hpp"

#include <sqlite3.h>

#include <cctype>
#include <iostream>
#include <map>
#include <stdexcept>
#include <utility>

using groups::clamp_group_size;
using groups::Course;
using groups::CourseId;
using groups::CourseRoster;
using groups::FormationConfig;
using groups::GroupId;
using groups::Student;
using groups::StudentId;
using groups::TimeSlot;
using groups::TimeSlotId;

namespace store {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS students (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    email TEXT NOT NULL UNIQUE,
    preferred_group_size INTEGER NOT NULL DEFAULT 3,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);

CREATE TABLE IF NOT EXISTS courses (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    code TEXT NOT NULL UNIQUE,
    name TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS student_courses (
    student_id INTEGER NOT NULL,
    course_id INTEGER NOT NULL,
    PRIMARY KEY (student_id, course_id),
    FOREIGN KEY (student_id) REFERENCES students(id) ON DELETE CASCADE,
    FOREIGN KEY (course_id) REFERENCES courses(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS timeslots (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    label TEXT NOT NULL UNIQUE,
    day_of_week TEXT NOT NULL,
    start_time TEXT NOT NULL,
    end_time TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS student_availability (
    student_id INTEGER NOT NULL,
    timeslot_id INTEGER NOT NULL,
    PRIMARY KEY (student_id, timeslot_id),
    FOREIGN KEY (student_id) REFERENCES students(id) ON DELETE CASCADE,
    FOREIGN KEY (timeslot_id) REFERENCES timeslots(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS study_groups (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    course_id INTEGER NOT NULL,
    group_index INTEGER NOT NULL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (course_id) REFERENCES courses(id) ON DELETE CASCADE
);

CREATE TABLE IF NOT EXISTS study_group_members (
    group_id INTEGER NOT NULL,
    student_id INTEGER NOT NULL,
    PRIMARY KEY (group_id, student_id),
    FOREIGN KEY (group_id) REFERENCES study_groups(id) ON DELETE CASCADE,
    FOREIGN KEY (student_id) REFERENCES students(id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_student_courses_student ON student_courses(student_id);
CREATE INDEX IF NOT EXISTS idx_student_courses_course ON student_courses(course_id);
CREATE INDEX IF NOT EXISTS idx_student_availability_student ON student_availability(student_id);
CREATE INDEX IF NOT EXISTS idx_student_availability_timeslot ON student_availability(timeslot_id);
CREATE INDEX IF NOT EXISTS idx_study_groups_course ON study_groups(course_id);
)SQL";

struct SeedCourse {
    const char* code;
    const char* name;
};

const SeedCourse kSeedCourses[] = {
    {"CS101", "Intro to Computer Science"},
    {"MATH201", "Discrete Mathematics"},
    {"PHYS150", "General Physics"},
};

struct SeedSlot {
    const char* label;
    const char* day;
    const char* start;
    const char* end;
};

const SeedSlot kSeedSlots[] = {
    {"Mon 10-12", "Mon", "10:00", "12:00"},
    {"Mon 14-16", "Mon", "14:00", "16:00"},
    {"Tue 10-12", "Tue", "10:00", "12:00"},
    {"Tue 14-16", "Tue", "14:00", "16:00"},
    {"Wed 10-12", "Wed", "10:00", "12:00"},
    {"Wed 14-16", "Wed", "14:00", "16:00"},
};

// Owns one prepared statement; every failing call throws StorageError.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            const std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(m_stmt);
            throw StorageError("failed to prepare statement: " + msg);
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, long long v) { check(sqlite3_bind_int64(m_stmt, idx, v)); }
    void bind(int idx, const std::string& s) {
        check(sqlite3_bind_text(m_stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT));
    }

    // true while rows are produced, false once the statement is done
    bool step() {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("sqlite step failed: ") + sqlite3_errmsg(m_db));
    }

    void run() {
        while (step()) {
        }
    }

    void reset() {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

    long long column_int(int col) const { return sqlite3_column_int64(m_stmt, col); }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(m_stmt, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw StorageError(std::string("sqlite bind failed: ") + sqlite3_errmsg(m_db));
    }

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_stmt = nullptr;
};

std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

void rollback_or_warn(sqlite3* db) {
    if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "warning: rollback failed: " << sqlite3_errmsg(db) << "\n";
    }
}

bool row_exists(sqlite3* db, const char* sql, long long id) {
    Statement st(db, sql);
    st.bind(1, id);
    return st.step();
}

}  // namespace

SqliteStore::SqliteStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
        const std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw StorageError("failed to open database " + path + ": " + msg);
    }
    exec("PRAGMA foreign_keys = ON;");
}

SqliteStore::~SqliteStore() {
    if (m_in_replace) rollback_replace();
    sqlite3_close(m_db);
}

void SqliteStore::exec(const std::string& sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errmsg(m_db);
        sqlite3_free(err);
        throw StorageError("sqlite exec failed: " + msg);
    }
}

void SqliteStore::init_schema() {
    exec(kSchema);

    exec("BEGIN;");
    try {
        Statement course(m_db, "INSERT OR IGNORE INTO courses (code, name) VALUES (?, ?)");
        for (const auto& c : kSeedCourses) {
            course.bind(1, std::string(c.code));
            course.bind(2, std::string(c.name));
            course.run();
            course.reset();
        }

        Statement slot(m_db,
                       "INSERT OR IGNORE INTO timeslots (label, day_of_week, start_time, end_time) "
                       "VALUES (?, ?, ?, ?)");
        for (const auto& s : kSeedSlots) {
            slot.bind(1, std::string(s.label));
            slot.bind(2, std::string(s.day));
            slot.bind(3, std::string(s.start));
            slot.bind(4, std::string(s.end));
            slot.run();
            slot.reset();
        }
        exec("COMMIT;");
    } catch (...) {
        rollback_or_warn(m_db);
        throw;
    }
}

std::vector<Course> SqliteStore::list_courses() {
    std::vector<Course> out;
    Statement st(m_db, "SELECT id, code, name FROM courses ORDER BY code");
    while (st.step()) {
        Course c;
        c.id = st.column_int(0);
        c.code = st.column_text(1);
        c.name = st.column_text(2);
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<TimeSlot> SqliteStore::list_timeslots() {
    std::vector<TimeSlot> out;
    Statement st(m_db,
                 "SELECT id, label, day_of_week, start_time, end_time FROM timeslots "
                 "ORDER BY day_of_week, start_time");
    while (st.step()) {
        TimeSlot t;
        t.id = st.column_int(0);
        t.label = st.column_text(1);
        t.day_of_week = st.column_text(2);
        t.start_time = st.column_text(3);
        t.end_time = st.column_text(4);
        out.push_back(std::move(t));
    }
    return out;
}

std::vector<Student> SqliteStore::list_students() {
    std::vector<Student> out;
    std::map<StudentId, size_t> pos;

    {
        Statement st(m_db, "SELECT id, name, email, preferred_group_size FROM students ORDER BY id DESC");
        while (st.step()) {
            Student s;
            s.id = st.column_int(0);
            s.name = st.column_text(1);
            s.email = st.column_text(2);
            s.preferred_group_size = static_cast<int>(st.column_int(3));
            pos[s.id] = out.size();
            out.push_back(std::move(s));
        }
    }

    {
        Statement st(m_db, "SELECT student_id, course_id FROM student_courses ORDER BY student_id, course_id");
        while (st.step()) {
            auto it = pos.find(st.column_int(0));
            if (it != pos.end()) out[it->second].course_ids.push_back(st.column_int(1));
        }
    }

    {
        Statement st(m_db, "SELECT student_id, timeslot_id FROM student_availability");
        while (st.step()) {
            auto it = pos.find(st.column_int(0));
            if (it != pos.end()) out[it->second].availability.insert(st.column_int(1));
        }
    }

    return out;
}

StudentId SqliteStore::upsert_student(const Student& input) {
    const std::string name = trim_copy(input.name);
    const std::string email = to_lower_copy(trim_copy(input.email));
    if (name.empty() || email.empty()) throw std::invalid_argument("name and email are required");

    const int size = clamp_group_size(input.preferred_group_size, FormationConfig{});

    for (CourseId cid : input.course_ids) {
        if (!row_exists(m_db, "SELECT 1 FROM courses WHERE id = ?", cid)) {
            throw std::invalid_argument("unknown course id: " + std::to_string(cid));
        }
    }
    for (TimeSlotId tid : input.availability) {
        if (!row_exists(m_db, "SELECT 1 FROM timeslots WHERE id = ?", tid)) {
            throw std::invalid_argument("unknown timeslot id: " + std::to_string(tid));
        }
    }

    exec("BEGIN;");
    try {
        StudentId student_id = 0;
        {
            Statement find(m_db, "SELECT id FROM students WHERE email = ?");
            find.bind(1, email);
            if (find.step()) student_id = find.column_int(0);
        }

        if (student_id != 0) {
            Statement upd(m_db, "UPDATE students SET name = ?, preferred_group_size = ? WHERE id = ?");
            upd.bind(1, name);
            upd.bind(2, static_cast<long long>(size));
            upd.bind(3, student_id);
            upd.run();

            Statement del_courses(m_db, "DELETE FROM student_courses WHERE student_id = ?");
            del_courses.bind(1, student_id);
            del_courses.run();

            Statement del_slots(m_db, "DELETE FROM student_availability WHERE student_id = ?");
            del_slots.bind(1, student_id);
            del_slots.run();
        } else {
            Statement ins(m_db, "INSERT INTO students (name, email, preferred_group_size) VALUES (?, ?, ?)");
            ins.bind(1, name);
            ins.bind(2, email);
            ins.bind(3, static_cast<long long>(size));
            ins.run();
            student_id = sqlite3_last_insert_rowid(m_db);
        }

        Statement enroll(m_db, "INSERT OR IGNORE INTO student_courses (student_id, course_id) VALUES (?, ?)");
        for (CourseId cid : input.course_ids) {
            enroll.bind(1, student_id);
            enroll.bind(2, cid);
            enroll.run();
            enroll.reset();
        }

        Statement avail(m_db, "INSERT OR IGNORE INTO student_availability (student_id, timeslot_id) VALUES (?, ?)");
        for (TimeSlotId tid : input.availability) {
            avail.bind(1, student_id);
            avail.bind(2, tid);
            avail.run();
            avail.reset();
        }

        exec("COMMIT;");
        return student_id;
    } catch (...) {
        rollback_or_warn(m_db);
        throw;
    }
}

std::vector<CourseRoster> SqliteStore::load_rosters() {
    std::map<StudentId, Student> base;
    {
        Statement st(m_db, "SELECT id, name, email, preferred_group_size FROM students");
        while (st.step()) {
            Student s;
            s.id = st.column_int(0);
            s.name = st.column_text(1);
            s.email = st.column_text(2);
            // rows written by other tools may carry anything here
            s.preferred_group_size = clamp_group_size(st.column_int(3), FormationConfig{});
            base[s.id] = std::move(s);
        }
    }

    {
        Statement st(m_db, "SELECT student_id, timeslot_id FROM student_availability");
        while (st.step()) {
            auto it = base.find(st.column_int(0));
            if (it != base.end()) it->second.availability.insert(st.column_int(1));
        }
    }

    std::vector<std::pair<CourseId, StudentId>> enrollments;
    {
        Statement st(m_db, "SELECT course_id, student_id FROM student_courses ORDER BY course_id, student_id");
        while (st.step()) {
            const CourseId cid = st.column_int(0);
            auto it = base.find(st.column_int(1));
            if (it == base.end()) continue;

            it->second.course_ids.push_back(cid);
            enrollments.emplace_back(cid, it->first);
        }
    }

    // every roster copy carries the student's full enrollment list
    std::vector<CourseRoster> out;
    for (const auto& [cid, sid] : enrollments) {
        if (out.empty() || out.back().course_id != cid) {
            CourseRoster r;
            r.course_id = cid;
            out.push_back(std::move(r));
        }
        out.back().students.push_back(base.at(sid));
    }
    return out;
}

void SqliteStore::begin_replace() {
    if (m_in_replace) throw StorageError("replace already in progress");
    exec("BEGIN IMMEDIATE;");
    m_in_replace = true;
}

void SqliteStore::clear_all_groups() {
    if (!m_in_replace) throw StorageError("clear_all_groups outside of begin_replace/commit_replace");
    exec("DELETE FROM study_group_members;");
    exec("DELETE FROM study_groups;");
}

GroupId SqliteStore::write_group(CourseId course_id, int group_index, const std::vector<StudentId>& member_ids) {
    if (!m_in_replace) throw StorageError("write_group outside of begin_replace/commit_replace");

    Statement ins(m_db, "INSERT INTO study_groups (course_id, group_index) VALUES (?, ?)");
    ins.bind(1, course_id);
    ins.bind(2, static_cast<long long>(group_index));
    ins.run();
    const GroupId group_id = sqlite3_last_insert_rowid(m_db);

    Statement member(m_db, "INSERT INTO study_group_members (group_id, student_id) VALUES (?, ?)");
    for (StudentId sid : member_ids) {
        member.bind(1, group_id);
        member.bind(2, sid);
        member.run();
        member.reset();
    }
    return group_id;
}

void SqliteStore::commit_replace() {
    if (!m_in_replace) throw StorageError("commit_replace without begin_replace");
    exec("COMMIT;");
    m_in_replace = false;
}

void SqliteStore::rollback_replace() {
    if (!m_in_replace) return;
    m_in_replace = false;
    rollback_or_warn(m_db);
}

std::vector<GroupView> SqliteStore::list_groups() {
    std::vector<GroupView> out;
    std::map<GroupId, size_t> pos;

    {
        Statement st(m_db,
                     "SELECT sg.id, sg.course_id, sg.group_index, c.code, c.name "
                     "FROM study_groups sg "
                     "JOIN courses c ON c.id = sg.course_id "
                     "ORDER BY c.code, sg.group_index");
        while (st.step()) {
            GroupView g;
            g.group_id = st.column_int(0);
            g.course_id = st.column_int(1);
            g.group_index = static_cast<int>(st.column_int(2));
            g.course_code = st.column_text(3);
            g.course_name = st.column_text(4);
            pos[g.group_id] = out.size();
            out.push_back(std::move(g));
        }
    }

    Statement st(m_db,
                 "SELECT sgm.group_id, s.id, s.name, s.email "
                 "FROM study_group_members sgm "
                 "JOIN students s ON s.id = sgm.student_id "
                 "ORDER BY s.name, s.id");
    while (st.step()) {
        auto it = pos.find(st.column_int(0));
        if (it == pos.end()) continue;

        MemberView m;
        m.id = st.column_int(1);
        m.name = st.column_text(2);
        m.email = st.column_text(3);
        out[it->second].members.push_back(std::move(m));
    }

    return out;
}

}  // namespace store
