#include "commands/catalog.hpp"
#include "commands/groups.hpp"
#include "commands/match.hpp"
#include "commands/students.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  study-groups init [--db <path>]\n"
        << "  study-groups courses [--db <path>]\n"
        << "  study-groups timeslots [--db <path>]\n"
        << "  study-groups student add [args]\n"
        << "  study-groups students [--db <path>]\n"
        << "  study-groups match [args]\n"
        << "  study-groups groups [--db <path>] [--out <path>]\n"
        << "  study-groups help\n";
    return 1;
}

static int print_student_add_help() {
    std::cerr
        << "usage:\n"
        << "  study-groups student add --name <str> --email <str> [options]\n"
        << "\n"
        << "options:\n"
        << "  --size <n>                   preferred group size, clamped to 2..5 (default: 3)\n"
        << "  --courses <ids>              comma separated course ids, e.g. 1,3\n"
        << "  --slots <ids>                comma separated time slot ids\n"
        << "  --db <path>                  default: study_groups.db\n"
        << "\n"
        << "an existing email updates that student and replaces its courses and slots\n";
    return 0;
}

static int print_match_help() {
    std::cerr
        << "usage:\n"
        << "  study-groups match [options]\n"
        << "\n"
        << "input (one of):\n"
        << "  --db <path>                  default: study_groups.db (groups are persisted)\n"
        << "  --roster <file.json>         match a roster file in memory\n"
        << "\n"
        << "options:\n"
        << "  --config <file.json>         base_score / min_group_size / max_group_size / fallback_group_size\n"
        << "  --out <path>                 write groups, target sizes and formation steps as JSON\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "student") {
        if (argc < 3 || std::string(argv[2]) != "add") return print_usage();
        if (argc >= 4 && std::string(argv[3]) == "--help") return print_student_add_help();
        return cmd_student_add(argc - 2, argv + 2);
    }

    if (cmd == "match" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_match_help();

    if (cmd == "init")      return cmd_init(argc - 1, argv + 1);
    if (cmd == "courses")   return cmd_courses(argc - 1, argv + 1);
    if (cmd == "timeslots") return cmd_timeslots(argc - 1, argv + 1);
    if (cmd == "students")  return cmd_students(argc - 1, argv + 1);
    if (cmd == "match")     return cmd_match(argc - 1, argv + 1);
    if (cmd == "groups")    return cmd_groups(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
