#ifndef BLOCKROLL_GAME_ENGINE_HPP
#define BLOCKROLL_GAME_ENGINE_HPP

#include "Animation.hpp"
#include "Movement.hpp"
#include "Renderer.hpp"
#include "Session.hpp"

// ============================================================================
// GAME ENGINE MODULE
// ============================================================================

namespace GameEngine {
    using Movement::Direction;

    class Game {
    private:
        Session::GameSession session;
        Animation::Animator animator;
        Renderer::GameRenderer renderer;
        double menuUnlockAt;

        double now() const;
        bool menuLocked();

    public:
        Game();

        bool start(int levelIndex);

        void handleRoll(Direction dir);
        void handleKeyEscape();
        void handleMenuLevel(int offset);   // -1 previous, 0 restart, +1 next

        void update() { animator.tick(now()); }
        void render() const { renderer.render(); }
        void initGL() const { renderer.initGL(); }
        void reshape(int w, int h) { renderer.resize(w, h); }

        bool isPaused() const { return session.isPaused(); }
    };
}

#endif
