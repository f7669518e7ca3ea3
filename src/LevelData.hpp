#ifndef BLOCKROLL_LEVEL_DATA_HPP
#define BLOCKROLL_LEVEL_DATA_HPP

#include "Geometry.hpp"

#include <string>
#include <vector>

// ============================================================================
// LEVEL DATA MODULE (bundled layouts)
// ============================================================================

namespace LevelData {
    using Geometry::Cell;

    struct LevelDef {
        Cell start;                       // block starts standing here
        std::vector<std::string> layout;  // see Board::TILE / Board::WIN_TILE
    };

    int count();
    int maxIndex();
    bool isValidIndex(int index);

    // Caller must pass a valid index
    const LevelDef& get(int index);
}

#endif
