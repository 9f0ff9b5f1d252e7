#pragma once

#include <set>

// Null markers recognized by default in level-order input (and by the format detector)
const std::set<int> default_null_markers{-1, -999};

struct BuildOptions {
    std::set<int> null_markers{default_null_markers};

    // check that the reconstructed tree accounts for every value of the input
    bool strict{false};

    bool is_null(int value) const { return null_markers.count(value) != 0; }
};
