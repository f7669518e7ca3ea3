#include "Board.hpp"

#include "Log.hpp"

#include <sstream>

namespace Board {
    bool TileBoard::loadLayout(const std::vector<std::string> &layout) {
        clear();

        int winCount = 0;
        for (size_t z = 0; z < layout.size(); ++z) {
            const std::string &row = layout[z];
            for (size_t x = 0; x < row.size(); ++x) {
                char c = row[x];
                if (c == EMPTY) continue;

                Cell cell((int)x, (int)z);
                if (c == TILE) {
                    tiles.insert(cell);
                } else if (c == WIN_TILE) {
                    tiles.insert(cell);
                    winningCell = cell;
                    ++winCount;
                } else {
                    std::ostringstream oss;
                    oss << "layout: unknown marker '" << c << "' at (" << x << "," << z << ")";
                    Log::error(oss.str());
                    clear();
                    return false;
                }
            }
            if ((int)row.size() > width) width = (int)row.size();
        }
        depth = (int)layout.size();

        if (winCount != 1) {
            std::ostringstream oss;
            oss << "layout: expected one winning tile, found " << winCount;
            Log::error(oss.str());
            clear();
            return false;
        }
        return true;
    }

    void TileBoard::setWinningCell(const Cell &cell) {
        tiles.insert(cell);
        winningCell = cell;
    }

    bool TileBoard::hasAllTiles(const std::vector<Cell> &cells) const {
        for (const auto &cell : cells) {
            if (!hasTile(cell))
                return false;
        }
        return true;
    }

    void TileBoard::clear() {
        tiles.clear();
        winningCell = Cell();
        width = 0;
        depth = 0;
    }
}
