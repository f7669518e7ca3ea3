#include "Movement.hpp"

#include "Config.hpp"
#include "Log.hpp"

#include <sstream>

namespace Movement {
    using namespace Math;
    using Geometry::Cell;

    const char* directionName(Direction dir) {
        switch (dir) {
        case Direction::PosX: return "+X";
        case Direction::NegX: return "-X";
        case Direction::PosZ: return "+Z";
        case Direction::NegZ: return "-Z";
        }
        return "?";
    }

    bool isAlongX(Direction dir) {
        return dir == Direction::PosX || dir == Direction::NegX;
    }

    int angleSign(Direction dir) {
        switch (dir) {
        case Direction::PosX: return -1;
        case Direction::NegX: return 1;
        case Direction::PosZ: return 1;
        case Direction::NegZ: return -1;
        }
        return 1;
    }

    double pivotOffset(Stance stance, Direction dir) {
        if (isAlongX(dir))
            return stance == Stance::LyingAlongX ? 1.0 : 0.5;
        return stance == Stance::LyingAlongZ ? 1.0 : 0.5;
    }

    Vec3 pivotPoint(const Vec3 &center, Stance stance, Direction dir) {
        double offset = pivotOffset(stance, dir);
        Vec3 pivot;
        switch (dir) {
        case Direction::PosX: pivot.x = twoPtRound(center.x) + offset; break;
        case Direction::NegX: pivot.x = twoPtRound(center.x) - offset; break;
        case Direction::PosZ: pivot.z = twoPtRound(center.z) + offset; break;
        case Direction::NegZ: pivot.z = twoPtRound(center.z) - offset; break;
        }
        return pivot;
    }

    Vec3 rollAxis(Direction dir) {
        return isAlongX(dir) ? Z_AXIS : X_AXIS;
    }

    bool isValidRoll(const Level::GameLevel &level, const Vec3 &pivot, const Vec3 &axis,
                     double angleDeg, Body *probeOut) {
        Body probe = Geometry::rotatedCopy(level.getBlock().getBody(), pivot, axis, angleDeg);
        std::vector<Cell> future = Geometry::classifyCells(probe.position);

        if (probeOut) *probeOut = probe;
        return level.getBoard().hasAllTiles(future);
    }

    RollPlan computeRoll(const Level::GameLevel &level, Direction dir) {
        const Block::RollingBlock &block = level.getBlock();

        RollPlan plan;
        plan.direction = dir;
        plan.pivot = pivotPoint(block.getPosition(), block.getStance(), dir);
        plan.axis = rollAxis(dir);

        double fullAngle = Config::ROLL_ANGLE_DEG * angleSign(dir);
        plan.legal = isValidRoll(level, plan.pivot, plan.axis, fullAngle, &plan.target);
        plan.angleDeg = plan.legal ? fullAngle : Config::BOUNCE_ANGLE_DEG * angleSign(dir);

        std::ostringstream oss;
        oss << "roll " << directionName(dir) << " from " << Geometry::stanceName(block.getStance())
            << " pivot (" << plan.pivot.x << "," << plan.pivot.z << ") -> "
            << (plan.legal ? "legal" : "blocked");
        Log::debug(oss.str());
        return plan;
    }

    bool planRoll(const Session::GameSession &session, Direction dir, RollPlan &plan) {
        if (!session.hasLevel() || session.isBusy() || session.overlayActive())
            return false;

        plan = computeRoll(session.getLevel(), dir);
        return true;
    }
}
