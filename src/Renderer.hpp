#ifndef BLOCKROLL_RENDERER_HPP
#define BLOCKROLL_RENDERER_HPP

#include "Animation.hpp"
#include "Session.hpp"

#include <string>

// ============================================================================
// RENDERER MODULE (fixed-function OpenGL)
// ============================================================================

namespace Renderer {
    class GameRenderer {
    private:
        const Session::GameSession *session;
        const Animation::Animator *animator;
        int viewW;
        int viewH;

        void setupCamera() const;
        void setupLights() const;

        void drawBox(double sx, double sy, double sz) const;
        void drawBoxEdges(double sx, double sy, double sz) const;
        void drawBoard() const;
        void drawBlock() const;

        void beginOverlay() const;
        void endOverlay() const;
        void drawText(float x, float y, const std::string &s) const;
        static void drawBanner(const std::string &text, float x, float y, float cell);
        void drawHud() const;
        void drawPauseMenu() const;
        void drawFade() const;

    public:
        GameRenderer(const Session::GameSession *s, const Animation::Animator *a)
            : session(s), animator(a), viewW(1), viewH(1) {}

        void initGL() const;
        void resize(int w, int h);
        void render() const;
    };
}

#endif
