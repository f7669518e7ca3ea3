#ifndef BLOCKROLL_BLOCK_HPP
#define BLOCKROLL_BLOCK_HPP

#include "Geometry.hpp"

#include <vector>

// ============================================================================
// BLOCK MODULE (the 1x2x1 rolling body)
// ============================================================================

namespace Block {
    using Geometry::Body;
    using Geometry::Cell;
    using Geometry::Stance;
    using Math::Vec3;

    // Stance after a quarter roll along X (alongX == true) or along Z
    Stance nextStance(Stance stance, bool alongX);

    class RollingBlock {
    private:
        Body body;
        Stance stance;

    public:
        RollingBlock() : stance(Stance::Standing) {}

        // Standing upright over `cell`
        explicit RollingBlock(const Cell& cell);

        const Body& getBody() const { return body; }
        const Vec3& getPosition() const { return body.position; }
        Stance getStance() const { return stance; }

        // Occupied cell(s) derived from the current position
        std::vector<Cell> cells() const;

        // Mid-animation pose; stance is left as it was when the tween started
        void setPose(const Body& pose) { body = pose; }

        // Commits a finished legal roll
        void commitRoll(const Body& target, bool alongX);

        void sink(double dy) { body.position.y -= dy; }
    };
}

#endif
