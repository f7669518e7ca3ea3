#include "Block.hpp"

#include "Config.hpp"

namespace Block {
    Stance nextStance(Stance stance, bool alongX) {
        switch (stance) {
        case Stance::Standing:
            return alongX ? Stance::LyingAlongX : Stance::LyingAlongZ;
        case Stance::LyingAlongX:
            return alongX ? Stance::Standing : Stance::LyingAlongX;
        case Stance::LyingAlongZ:
            return alongX ? Stance::LyingAlongZ : Stance::Standing;
        }
        return stance;
    }

    RollingBlock::RollingBlock(const Cell& cell)
        : body(Vec3(cell.x, Config::BLOCK_HALF_HEIGHT, cell.z)),
          stance(Stance::Standing) {}

    std::vector<Cell> RollingBlock::cells() const {
        return Geometry::classifyCells(body.position);
    }

    void RollingBlock::commitRoll(const Body& target, bool alongX) {
        body = target;
        stance = nextStance(stance, alongX);
    }
}
