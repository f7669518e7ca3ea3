#include "GameEngine.hpp"

#include "Config.hpp"
#include "Log.hpp"

#include <GL/glut.h>

namespace GameEngine {
    Game::Game()
        : animator(session), renderer(&session, &animator), menuUnlockAt(0) {}

    double Game::now() const {
        return (double)glutGet(GLUT_ELAPSED_TIME);
    }

    bool Game::menuLocked() {
        double t = now();
        if (t < menuUnlockAt) return true;
        menuUnlockAt = t + Config::MENU_LOCK_MS;
        return false;
    }

    bool Game::start(int levelIndex) {
        if (!session.loadLevel(levelIndex))
            return false;
        animator.resetCamera();
        return true;
    }

    void Game::handleRoll(Direction dir) {
        Movement::RollPlan plan;
        if (!Movement::planRoll(session, dir, plan))
            return;
        animator.startRoll(plan, now());
    }

    void Game::handleKeyEscape() {
        if (session.isPaused()) {
            if (menuLocked()) return;
            session.setPaused(false);
            Log::debug("sound: interface");
        } else {
            session.setPaused(true);
        }
    }

    void Game::handleMenuLevel(int offset) {
        if (!session.isPaused() || menuLocked())
            return;
        Log::debug("sound: interface");
        if (animator.startLevelTransition(offset, now()))
            session.setPaused(false);
    }
}
