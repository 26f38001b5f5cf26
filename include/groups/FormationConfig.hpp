#pragma once

namespace groups {

struct FormationConfig {
    // every pair in the same course starts here
    int base_score = 5;

    int min_group_size = 2;
    int max_group_size = 5;

    // used when no preference is available to take a median from
    int fallback_group_size = 3;
};

// takes the wide value so 64-bit input is clamped before it is narrowed
inline int clamp_group_size(long long size, const FormationConfig& cfg) {
    if (size < cfg.min_group_size) return cfg.min_group_size;
    if (size > cfg.max_group_size) return cfg.max_group_size;
    return static_cast<int>(size);
}

}  // namespace groups
