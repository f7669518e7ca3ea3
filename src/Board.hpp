#ifndef BLOCKROLL_BOARD_HPP
#define BLOCKROLL_BOARD_HPP

#include "Geometry.hpp"

#include <set>
#include <string>
#include <vector>

// ============================================================================
// BOARD MODULE (tile set + winning cell)
// ============================================================================

namespace Board {
    using Geometry::Cell;

    // Layout markers: rows are Z, columns are X
    const char TILE = '#';
    const char WIN_TILE = 'O';
    const char EMPTY = ' ';

    class TileBoard {
    private:
        std::set<Cell> tiles;
        Cell winningCell;
        int width;
        int depth;

    public:
        TileBoard() : width(0), depth(0) {}

        // Replaces the board with the one described by `layout`. Returns false
        // (board left empty) on an unknown marker or when the layout does not
        // hold exactly one winning tile.
        bool loadLayout(const std::vector<std::string> &layout);

        // Programmatic construction, mostly for tests
        void addTile(const Cell &cell) { tiles.insert(cell); }
        void setWinningCell(const Cell &cell);

        bool hasTile(const Cell &cell) const { return tiles.count(cell) != 0; }
        bool hasAllTiles(const std::vector<Cell> &cells) const;

        const std::set<Cell>& getTiles() const { return tiles; }
        const Cell& getWinningCell() const { return winningCell; }
        bool isWinningCell(const Cell &cell) const { return cell == winningCell; }
        int getWidth() const { return width; }
        int getDepth() const { return depth; }
        bool empty() const { return tiles.empty(); }

        void clear();
    };
}

#endif
