#include "Level.hpp"

#include "LevelData.hpp"
#include "Log.hpp"

#include <sstream>

namespace Level {
    bool isWinningPlacement(const TileBoard &board, const std::vector<Cell> &cells) {
        if (cells.size() != 1) return false;
        return board.isWinningCell(cells[0]);
    }

    bool GameLevel::load(int levelIndex, GameLevel &out) {
        if (!LevelData::isValidIndex(levelIndex)) {
            std::ostringstream oss;
            oss << "level " << levelIndex << " does not exist (0.." << LevelData::maxIndex() << ")";
            Log::warn(oss.str());
            return false;
        }

        const LevelData::LevelDef &def = LevelData::get(levelIndex);
        TileBoard board;
        if (!board.loadLayout(def.layout)) {
            std::ostringstream oss;
            oss << "level " << levelIndex << ": bad layout";
            Log::error(oss.str());
            return false;
        }

        out = GameLevel(levelIndex, board, RollingBlock(def.start));

        std::ostringstream oss;
        oss << "loaded level " << levelIndex << ": " << board.getTiles().size() << " tiles, "
            << "win (" << board.getWinningCell().x << "," << board.getWinningCell().z << "), "
            << "start (" << def.start.x << "," << def.start.z << ")";
        Log::info(oss.str());
        return true;
    }
}
