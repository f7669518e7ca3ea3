#include "Session.hpp"

#include "LevelData.hpp"
#include "Log.hpp"

#include <sstream>

namespace Session {
    bool GameSession::loadLevel(int index) {
        std::unique_ptr<GameLevel> next(new GameLevel());
        if (!GameLevel::load(index, *next))
            return false;

        level = std::move(next);
        completed = false;
        return true;
    }

    bool GameSession::canChangeLevel(int offset) const {
        if (!level) return false;
        return LevelData::isValidIndex(level->getIndex() + offset);
    }

    bool GameSession::changeLevel(int offset) {
        if (!canChangeLevel(offset)) {
            std::ostringstream oss;
            oss << "level change " << getLevelIndex() << " -> " << getLevelIndex() + offset
                << " ignored";
            Log::debug(oss.str());
            return false;
        }
        return loadLevel(level->getIndex() + offset);
    }
}
