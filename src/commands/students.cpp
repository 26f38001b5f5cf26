#include "commands/students.hpp"

#include "commands/ArgUtil.hpp"
#include "store/SqliteStore.hpp"

#include <iostream>
#include <string>

static void print_ids(const char* label, const std::vector<long long>& ids) {
    std::cout << "    " << label << ": ";
    for (size_t i = 0; i < ids.size(); ++i) {
        std::cout << ids[i];
        if (i + 1 < ids.size()) std::cout << ", ";
    }
    std::cout << "\n";
}

int cmd_student_add(int argc, char** argv) {
    try {
        const std::string db_path = get_arg(argc, argv, "--db", "study_groups.db");

        groups::Student input;
        input.name = get_arg(argc, argv, "--name", "");
        input.email = get_arg(argc, argv, "--email", "");
        input.preferred_group_size = get_arg_int(argc, argv, "--size", 3);
        input.course_ids = parse_id_list(get_arg(argc, argv, "--courses", ""));
        for (long long tid : parse_id_list(get_arg(argc, argv, "--slots", ""))) input.availability.insert(tid);

        if (input.name.empty() || input.email.empty()) {
            std::cerr << "error: missing --name and/or --email\n";
            return 1;
        }

        store::SqliteStore db(db_path);
        db.init_schema();
        const groups::StudentId id = db.upsert_student(input);

        std::cout << "STUDENT_ID: " << id << "\n";
        std::cout << "COURSES: " << input.course_ids.size() << "\n";
        std::cout << "SLOTS: " << input.availability.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "student add failed: " << e.what() << "\n";
        return 1;
    }
}

int cmd_students(int argc, char** argv) {
    try {
        store::SqliteStore db(get_arg(argc, argv, "--db", "study_groups.db"));
        db.init_schema();

        for (const auto& s : db.list_students()) {
            std::cout << "[" << s.id << "] " << s.name << " <" << s.email << ">"
                      << " size=" << s.preferred_group_size << "\n";
            print_ids("courses", s.course_ids);
            print_ids("slots", std::vector<long long>(s.availability.begin(), s.availability.end()));
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "students failed: " << e.what() << "\n";
        return 1;
    }
}
