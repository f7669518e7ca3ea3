#ifndef BLOCKROLL_MOVEMENT_HPP
#define BLOCKROLL_MOVEMENT_HPP

#include "Level.hpp"
#include "Session.hpp"

// ============================================================================
// MOVEMENT MODULE (pivot selection + roll validity)
// ============================================================================

namespace Movement {
    using Math::Vec3;
    using Geometry::Body;
    using Geometry::Stance;

    enum class Direction {
        PosX,
        NegX,
        PosZ,
        NegZ
    };

    const char* directionName(Direction dir);
    bool isAlongX(Direction dir);

    // +1 or -1: sign of the roll angle for `dir`
    int angleSign(Direction dir);

    // Distance from the block centre to the pivot edge along the roll axis:
    // 1.0 when the block lies along that axis, else 0.5
    double pivotOffset(Stance stance, Direction dir);

    // Pivot on the floor (y = 0) under the leading edge of the block
    Vec3 pivotPoint(const Vec3 &center, Stance stance, Direction dir);

    // World axis the roll turns about: Z for X rolls, X for Z rolls
    Vec3 rollAxis(Direction dir);

    struct RollPlan {
        bool legal;
        Direction direction;
        Vec3 pivot;
        Vec3 axis;
        double angleDeg;    // +-90 when legal, +-30 bounce otherwise
        Body target;        // pose after a full 90 degree roll

        RollPlan() : legal(false), direction(Direction::PosX), angleDeg(0) {}
    };

    // True when every cell the rotated probe would cover is a board tile
    bool isValidRoll(const Level::GameLevel &level, const Vec3 &pivot, const Vec3 &axis,
                     double angleDeg, Body *probeOut = nullptr);

    // Pure geometry: plan a roll of `level`'s block regardless of session state
    RollPlan computeRoll(const Level::GameLevel &level, Direction dir);

    // Returns false (plan untouched) when input must be dropped: no level, an
    // animation in flight or an overlay active
    bool planRoll(const Session::GameSession &session, Direction dir, RollPlan &plan);
}

#endif
