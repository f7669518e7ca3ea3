#ifndef BLOCKROLL_SESSION_HPP
#define BLOCKROLL_SESSION_HPP

#include "Level.hpp"

#include <memory>

// ============================================================================
// SESSION MODULE (current level + busy/pause state)
// ============================================================================

namespace Session {
    using Level::GameLevel;

    class GameSession {
    private:
        std::unique_ptr<GameLevel> level;
        bool busy;        // an animation is in flight
        bool paused;      // pause overlay visible
        bool completed;   // last level won

    public:
        GameSession() : busy(false), paused(false), completed(false) {}

        // Loads `index` as the current level; false leaves the session as it was
        bool loadLevel(int index);

        // currentIndex + offset; out-of-range targets are ignored (returns false)
        bool canChangeLevel(int offset) const;
        bool changeLevel(int offset);

        bool hasLevel() const { return level != nullptr; }
        GameLevel& getLevel() { return *level; }
        const GameLevel& getLevel() const { return *level; }
        int getLevelIndex() const { return level ? level->getIndex() : -1; }

        bool isBusy() const { return busy; }
        void setBusy(bool value) { busy = value; }

        bool isPaused() const { return paused; }
        void setPaused(bool value) { paused = value; }
        void togglePaused() { paused = !paused; }

        bool isCompleted() const { return completed; }
        void setCompleted(bool value) { completed = value; }

        // Any state in which roll input must be ignored besides `busy`
        bool overlayActive() const { return paused || completed; }
    };
}

#endif
