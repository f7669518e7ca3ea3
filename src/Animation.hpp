#ifndef BLOCKROLL_ANIMATION_HPP
#define BLOCKROLL_ANIMATION_HPP

#include "Movement.hpp"
#include "Session.hpp"

// ============================================================================
// ANIMATION MODULE (tweens driven by the render loop tick)
// ============================================================================

namespace Animation {
    using Math::Vec3;
    using Geometry::Body;
    using Movement::RollPlan;

    typedef double (*Easing)(double t);

    double linear(double t);
    double easeInOutCubic(double t);

    enum class TweenKind {
        None,
        Roll,       // legal 90 degree roll
        Bounce,     // blocked roll: forward to +-30 degrees, then back
        WinSink,    // block drops into the winning hole
        Fade        // fade out, swap level, fade in
    };

    const char* tweenName(TweenKind kind);

    // Step k (1-based) fires at startMs + k * stepMs
    struct Tween {
        TweenKind kind;
        double startMs;
        int stepMs;
        int steps;
        int stepsDone;
        Easing ease;

        RollPlan plan;      // Roll / Bounce
        Body startPose;     // Roll / Bounce
        bool holding;       // WinSink: sinking done, waiting to transition
        int levelOffset;    // Fade

        Tween()
            : kind(TweenKind::None), startMs(0), stepMs(1), steps(0), stepsDone(0),
              ease(linear), holding(false), levelOffset(0) {}
    };

    class Animator {
    private:
        Session::GameSession &session;
        Tween tween;
        Vec3 camera;
        double opacity;
        int wins;

        void begin(const Tween &next);
        void finish();
        void step(double stepTimeMs);

        void stepRoll();
        void stepBounce();
        void stepWinSink(double stepTimeMs);
        void stepFade();

        void startWinSink(double startMs);
        void startFade(int offset, double startMs);

    public:
        explicit Animator(Session::GameSession &s);

        bool isRunning() const { return tween.kind != TweenKind::None; }
        TweenKind currentKind() const { return tween.kind; }

        const Vec3& getCamera() const { return camera; }
        double getOpacity() const { return opacity; }
        int getWinCount() const { return wins; }

        // Camera snapped to the block (level start / level change)
        void resetCamera();

        // Starts the roll or bounce described by `plan`. False while busy.
        bool startRoll(const RollPlan &plan, double nowMs);

        // Fade to currentIndex + offset. False while busy or when the target
        // index does not exist (the current level stays).
        bool startLevelTransition(int offset, double nowMs);

        // Applies every step that has come due by `nowMs`
        void tick(double nowMs);
    };
}

#endif
