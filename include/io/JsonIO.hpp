#pragma once
#include <string>

#include "nlohmann/json.hpp"

#include "groups/FormationConfig.hpp"
#include "store/Store.hpp"

// Roster file: { "courses": [...], "timeslots": [...], "students": [...] }
// Every array is optional. Errors name the offending path, e.g.
// "root.students[2].id must be an integer".
store::Dataset parseDataset(const nlohmann::json& j);
store::Dataset loadRosterFile(const std::string& path);

// Optional keys: base_score, min_group_size, max_group_size, fallback_group_size.
groups::FormationConfig parseFormationConfig(const nlohmann::json& j);
groups::FormationConfig loadFormationConfig(const std::string& path);
