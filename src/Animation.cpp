#include "Animation.hpp"

#include "Config.hpp"
#include "Log.hpp"

#include <sstream>

namespace Animation {
    using namespace Math;

    double linear(double t) {
        return t;
    }

    double easeInOutCubic(double t) {
        if (t < 0.5) return 4.0 * t * t * t;
        double f = -2.0 * t + 2.0;
        return 1.0 - f * f * f / 2.0;
    }

    const char* tweenName(TweenKind kind) {
        switch (kind) {
        case TweenKind::None:    return "none";
        case TweenKind::Roll:    return "roll";
        case TweenKind::Bounce:  return "bounce";
        case TweenKind::WinSink: return "win";
        case TweenKind::Fade:    return "fade";
        }
        return "?";
    }

    Animator::Animator(Session::GameSession &s) : session(s), opacity(1.0), wins(0) {
        resetCamera();
    }

    void Animator::resetCamera() {
        Vec3 offset(Config::CAMERA_OFFSET_X, Config::CAMERA_OFFSET_Y, Config::CAMERA_OFFSET_Z);
        if (session.hasLevel())
            camera = session.getLevel().getBlock().getPosition() + offset;
        else
            camera = offset;
    }

    void Animator::begin(const Tween &next) {
        tween = next;
        session.setBusy(true);
    }

    void Animator::finish() {
        tween = Tween();
        session.setBusy(false);
    }

    bool Animator::startRoll(const RollPlan &plan, double nowMs) {
        if (session.isBusy() || !session.hasLevel())
            return false;

        Tween t;
        t.kind = plan.legal ? TweenKind::Roll : TweenKind::Bounce;
        t.startMs = nowMs;
        t.stepMs = plan.legal ? Config::ROLL_STEP_MS : Config::BOUNCE_STEP_MS;
        t.steps = plan.legal ? Config::ROLL_STEPS : 2 * Config::BOUNCE_STEPS;
        t.plan = plan;
        t.startPose = session.getLevel().getBlock().getBody();
        begin(t);
        return true;
    }

    bool Animator::startLevelTransition(int offset, double nowMs) {
        if (session.isBusy())
            return false;
        if (!session.canChangeLevel(offset)) {
            std::ostringstream oss;
            oss << "no level at " << session.getLevelIndex() + offset;
            Log::debug(oss.str());
            return false;
        }
        startFade(offset, nowMs);
        return true;
    }

    void Animator::startWinSink(double startMs) {
        Tween t;
        t.kind = TweenKind::WinSink;
        t.startMs = startMs + Config::WIN_DELAY_MS;
        t.stepMs = Config::WIN_STEP_MS;
        t.steps = 0;    // open-ended, ends when the block is below the floor
        begin(t);
        Log::info("sound: slide");
    }

    void Animator::startFade(int offset, double startMs) {
        Tween t;
        t.kind = TweenKind::Fade;
        t.startMs = startMs;
        t.stepMs = Config::FADE_STEP_MS;
        t.steps = 2 * Config::FADE_STEPS;
        t.levelOffset = offset;
        begin(t);
    }

    void Animator::tick(double nowMs) {
        while (isRunning()) {
            double due = tween.startMs + (tween.stepsDone + 1) * (double)tween.stepMs;
            if (nowMs < due) return;
            ++tween.stepsDone;
            step(due);
        }
    }

    void Animator::step(double stepTimeMs) {
        switch (tween.kind) {
        case TweenKind::Roll:    stepRoll(); break;
        case TweenKind::Bounce:  stepBounce(); break;
        case TweenKind::WinSink: stepWinSink(stepTimeMs); break;
        case TweenKind::Fade:    stepFade(); break;
        case TweenKind::None:    break;
        }
    }

    void Animator::stepRoll() {
        Block::RollingBlock &block = session.getLevel().getBlock();
        const RollPlan &plan = tween.plan;

        Vec3 offset(Config::CAMERA_OFFSET_X, Config::CAMERA_OFFSET_Y, Config::CAMERA_OFFSET_Z);
        camera = lerp(camera, plan.target.position + offset, 1.0 / tween.steps);

        if (tween.stepsDone < tween.steps) {
            double f = tween.ease((double)tween.stepsDone / tween.steps);
            block.setPose(Geometry::rotatedCopy(tween.startPose, plan.pivot, plan.axis, plan.angleDeg * f));
            return;
        }

        // Final step lands exactly on the pose that was validated
        double endMs = tween.startMs + tween.steps * (double)tween.stepMs;
        block.commitRoll(plan.target, Movement::isAlongX(plan.direction));
        finish();

        const Level::GameLevel &level = session.getLevel();
        if (level.isWon()) {
            ++wins;
            std::ostringstream oss;
            oss << "level " << level.getIndex() << " solved";
            Log::info(oss.str());
            startWinSink(endMs);
        } else {
            Log::debug("sound: click");
        }
    }

    void Animator::stepBounce() {
        Block::RollingBlock &block = session.getLevel().getBlock();
        const RollPlan &plan = tween.plan;
        int half = tween.steps / 2;

        if (tween.stepsDone < tween.steps) {
            int k = tween.stepsDone <= half ? tween.stepsDone : tween.steps - tween.stepsDone;
            double f = tween.ease((double)k / half);
            block.setPose(Geometry::rotatedCopy(tween.startPose, plan.pivot, plan.axis, plan.angleDeg * f));
            return;
        }

        block.setPose(tween.startPose);
        finish();
        Log::debug("sound: error");
    }

    void Animator::stepWinSink(double stepTimeMs) {
        Block::RollingBlock &block = session.getLevel().getBlock();

        if (!tween.holding) {
            if (twoPtRound(block.getPosition().y) >= Config::WIN_SINK_FLOOR) {
                block.sink(Config::WIN_SINK_STEP);
                return;
            }
            // Sunk: wait before the transition
            Log::info("sound: win");
            tween.holding = true;
            tween.startMs = stepTimeMs;
            tween.stepMs = Config::WIN_TRANSITION_DELAY_MS;
            tween.stepsDone = 0;
            return;
        }

        if (session.canChangeLevel(1)) {
            startFade(1, stepTimeMs);
            return;
        }

        finish();
        session.setCompleted(true);
        Log::info("all levels complete");
    }

    void Animator::stepFade() {
        int half = tween.steps / 2;

        if (tween.stepsDone < half) {
            opacity = 1.0 - (double)tween.stepsDone / half;
            return;
        }
        if (tween.stepsDone == half) {
            opacity = 0.0;
            int from = session.getLevelIndex();
            if (session.changeLevel(tween.levelOffset)) {
                std::ostringstream oss;
                oss << "level " << from << " -> " << session.getLevelIndex();
                Log::info(oss.str());
            }
            resetCamera();
            return;
        }

        opacity = (double)(tween.stepsDone - half) / half;
        if (tween.stepsDone >= tween.steps) {
            opacity = 1.0;
            finish();
        }
    }
}
