#include "commands/match.hpp"

#include "commands/ArgUtil.hpp"
#include "groups/CourseMatching.hpp"
#include "groups/MatchingArtifact.hpp"
#include "io/JsonIO.hpp"
#include "store/MemoryStore.hpp"
#include "store/SqliteStore.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

static void print_result(const groups::MatchingResult& res) {
    for (const auto& c : res.courses) {
        std::cout << "\nCOURSE " << c.course_id << " (target " << c.target_size << ")\n";
        for (size_t i = 0; i < c.groups.size(); ++i) {
            std::cout << "  #" << (i + 1) << ": ";
            for (size_t k = 0; k < c.groups[i].size(); ++k) {
                if (k) std::cout << ", ";
                std::cout << c.groups[i][k];
            }
            std::cout << "\n";
        }
    }
}

int cmd_match(int argc, char** argv) {
    try {
        const std::string roster_path = get_arg(argc, argv, "--roster", "");
        const std::string db_path = get_arg(argc, argv, "--db", "study_groups.db");
        const std::string config_path = get_arg(argc, argv, "--config", "");
        const std::string out_path = get_arg(argc, argv, "--out", "");

        if (!roster_path.empty() && has_flag(argc, argv, "--db")) {
            std::cerr << "error: use either --roster or --db, not both\n";
            return 1;
        }

        groups::FormationConfig cfg;
        if (!config_path.empty()) cfg = loadFormationConfig(config_path);

        // roster files are matched in memory; nothing is written back to them
        std::unique_ptr<store::MemoryStore> mem;
        std::unique_ptr<store::SqliteStore> db;
        store::RosterProvider* rosters = nullptr;
        store::ResultSink* sink = nullptr;

        if (!roster_path.empty()) {
            mem = std::make_unique<store::MemoryStore>(loadRosterFile(roster_path));
            rosters = mem.get();
            sink = mem.get();
        } else {
            db = std::make_unique<store::SqliteStore>(db_path);
            db->init_schema();
            rosters = db.get();
            sink = db.get();
        }

        groups::CourseMatcher matcher(*rosters, *sink, cfg);
        const groups::MatchingResult res = matcher.run_matching();

        const std::string source = roster_path.empty() ? db_path : roster_path;
        std::cout << "SOURCE: " << source << "\n";
        std::cout << "COURSES: " << res.courses.size() << "\n";

        size_t group_count = 0;
        for (const auto& c : res.courses) group_count += c.groups.size();
        std::cout << "GROUPS: " << group_count << "\n";

        if (res.empty()) {
            std::cout << "nothing to match (no enrolled students)\n";
        } else {
            print_result(res);
        }

        if (!out_path.empty()) {
            groups::MatchingArtifact artifact;
            artifact.source = source;
            artifact.cfg = cfg;
            artifact.result = res;
            artifact.write_to(fs::path(out_path));
            std::cout << "\nOUT_MATCH: " << out_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "match failed: " << e.what() << "\n";
        return 1;
    }
}
