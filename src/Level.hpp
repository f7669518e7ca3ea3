#ifndef BLOCKROLL_LEVEL_HPP
#define BLOCKROLL_LEVEL_HPP

#include "Block.hpp"
#include "Board.hpp"

#include <vector>

// ============================================================================
// LEVEL MODULE (board + block for one level index)
// ============================================================================

namespace Level {
    using Geometry::Cell;
    using Board::TileBoard;
    using Block::RollingBlock;

    // Standing (single cell) exactly on the winning cell
    bool isWinningPlacement(const TileBoard &board, const std::vector<Cell> &cells);

    class GameLevel {
    private:
        int index;
        TileBoard board;
        RollingBlock block;

    public:
        GameLevel() : index(-1) {}
        GameLevel(int levelIndex, const TileBoard &b, const RollingBlock &blk)
            : index(levelIndex), board(b), block(blk) {}

        // Builds level `levelIndex` from the bundled data
        static bool load(int levelIndex, GameLevel &out);

        int getIndex() const { return index; }
        const TileBoard& getBoard() const { return board; }
        const RollingBlock& getBlock() const { return block; }
        RollingBlock& getBlock() { return block; }

        std::vector<Cell> blockCells() const { return block.cells(); }
        bool isWon() const { return isWinningPlacement(board, block.cells()); }
    };
}

#endif
