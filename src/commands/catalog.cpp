#include "commands/catalog.hpp"

#include "commands/ArgUtil.hpp"
#include "store/SqliteStore.hpp"

#include <iostream>
#include <string>

int cmd_init(int argc, char** argv) {
    try {
        const std::string db_path = get_arg(argc, argv, "--db", "study_groups.db");

        store::SqliteStore db(db_path);
        db.init_schema();

        std::cout << "DB: " << db_path << "\n";
        std::cout << "COURSES: " << db.list_courses().size() << "\n";
        std::cout << "TIMESLOTS: " << db.list_timeslots().size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "init failed: " << e.what() << "\n";
        return 1;
    }
}

int cmd_courses(int argc, char** argv) {
    try {
        store::SqliteStore db(get_arg(argc, argv, "--db", "study_groups.db"));
        db.init_schema();

        for (const auto& c : db.list_courses()) {
            std::cout << c.id << "\t" << c.code << "\t" << c.name << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "courses failed: " << e.what() << "\n";
        return 1;
    }
}

int cmd_timeslots(int argc, char** argv) {
    try {
        store::SqliteStore db(get_arg(argc, argv, "--db", "study_groups.db"));
        db.init_schema();

        for (const auto& t : db.list_timeslots()) {
            std::cout << t.id << "\t" << t.label << "\t" << t.day_of_week << " "
                      << t.start_time << "-" << t.end_time << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "timeslots failed: " << e.what() << "\n";
        return 1;
    }
}
