#include "commands/groups.hpp"

#include "commands/ArgUtil.hpp"
#include "groups/MatchingArtifact.hpp"
#include "store/SqliteStore.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_groups(int argc, char** argv) {
    try {
        const std::string db_path = get_arg(argc, argv, "--db", "study_groups.db");
        const std::string out_path = get_arg(argc, argv, "--out", "");

        store::SqliteStore db(db_path);
        db.init_schema();
        const std::vector<store::GroupView> views = db.list_groups();

        if (views.empty()) {
            std::cout << "no groups yet (run `study-groups match` first)\n";
        }

        std::string current_course;
        for (const auto& v : views) {
            if (v.course_code != current_course) {
                current_course = v.course_code;
                std::cout << "\n[" << v.course_code << "] " << v.course_name << "\n";
            }
            std::cout << "  Group " << v.group_index << "\n";
            for (const auto& m : v.members) {
                std::cout << "    - " << m.name << " <" << m.email << ">\n";
            }
        }

        if (!out_path.empty()) {
            groups::write_json_file(std::filesystem::path(out_path), groups::group_views_to_json(views));
            std::cout << "\nOUT_GROUPS: " << out_path << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "groups failed: " << e.what() << "\n";
        return 1;
    }
}
