#ifndef BLOCKROLL_GEOMETRY_HPP
#define BLOCKROLL_GEOMETRY_HPP

#include "Math.hpp"

#include <vector>

// ============================================================================
// GEOMETRY MODULE (rigid bodies and board cells)
// ============================================================================

namespace Geometry {
    using Math::Vec3;
    using Math::Quat;

    // Rigid body transform. Plain value: copies never share state.
    struct Body {
        Vec3 position;
        Quat orientation;

        Body() {}
        Body(const Vec3& pos, const Quat& rot = Quat()) : position(pos), orientation(rot) {}
    };

    // Integer board cell, X column and Z row
    struct Cell {
        int x, z;
        Cell(int _x = 0, int _z = 0) : x(_x), z(_z) {}

        bool operator==(const Cell& other) const { return x == other.x && z == other.z; }
        bool operator!=(const Cell& other) const { return !(*this == other); }
        bool operator<(const Cell& other) const {
            return x < other.x || (x == other.x && z < other.z);
        }
    };

    enum class Stance {
        Standing,
        LyingAlongX,
        LyingAlongZ
    };

    const char* stanceName(Stance stance);

    // Rotates `body` in place about the world-space line through `pivot` along `axis`
    void rotateAroundWorldAxis(Body& body, const Vec3& pivot, const Vec3& axis, double angleDeg);

    // Same transform applied to an independent copy; `body` is untouched
    Body rotatedCopy(const Body& body, const Vec3& pivot, const Vec3& axis, double angleDeg);

    // One cell when both coordinates round to integers (standing), otherwise the two
    // cells either side of the half-integer coordinate (lying)
    std::vector<Cell> classifyCells(const Vec3& position);

    // Stance implied by a classification result
    Stance stanceOf(const std::vector<Cell>& cells);
}

#endif
