#include "Geometry.hpp"

#include <cmath>

namespace Geometry {
    using namespace Math;

    const char* stanceName(Stance stance) {
        switch (stance) {
        case Stance::Standing:    return "standing";
        case Stance::LyingAlongX: return "lying-x";
        case Stance::LyingAlongZ: return "lying-z";
        }
        return "?";
    }

    void rotateAroundWorldAxis(Body& body, const Vec3& pivot, const Vec3& axis, double angleDeg) {
        Quat q = quatFromAxisAngle(axis, angleDeg);

        // World-space rotation: pre-multiply the body's own orientation
        body.orientation = (q * body.orientation).normalized();

        Vec3 rel = body.position - pivot;
        body.position = q.rotate(rel) + pivot;
    }

    Body rotatedCopy(const Body& body, const Vec3& pivot, const Vec3& axis, double angleDeg) {
        Body copy = body;
        rotateAroundWorldAxis(copy, pivot, axis, angleDeg);
        return copy;
    }

    std::vector<Cell> classifyCells(const Vec3& position) {
        double hx = halfRound(position.x);
        double hz = halfRound(position.z);

        std::vector<Cell> cells;
        if (isInt(hx) && isInt(hz)) {
            cells.push_back(Cell((int)hx, (int)hz));
        } else {
            cells.push_back(Cell((int)std::floor(hx), (int)std::floor(hz)));
            cells.push_back(Cell((int)std::ceil(hx), (int)std::ceil(hz)));
        }
        return cells;
    }

    Stance stanceOf(const std::vector<Cell>& cells) {
        if (cells.size() < 2) return Stance::Standing;
        return (cells[0].x != cells[1].x) ? Stance::LyingAlongX : Stance::LyingAlongZ;
    }
}
