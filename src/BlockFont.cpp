#include "BlockFont.hpp"

namespace BlockFont {
    std::map<char, Glyph> font;

    void init() {
        font['P'] = {
            {0,0},{0,1},{0,2},{0,3},{0,4},{0,5},{0,6},
            {1,6},{2,6},{3,6},{4,5},{4,4},
            {1,3},{2,3},{3,3}
        };

        font['A'] = {
            {1,6},{2,6},{3,6},{4,6},
            {0,5},{5,5},
            {0,4},{5,4},
            {0,3},{1,3},{2,3},{3,3},{4,3},{5,3},
            {0,2},{5,2},
            {0,1},{5,1},
            {0,0},{5,0}
        };

        font['U'] = {
            {0,6},{0,5},{0,4},{0,3},{0,2},{0,1},
            {5,6},{5,5},{5,4},{5,3},{5,2},{5,1},
            {1,0},{2,0},{3,0},{4,0}
        };

        font['S'] = {
            {1,6},{2,6},{3,6},{4,6},{5,6},
            {0,5},{0,4},
            {1,3},{2,3},{3,3},{4,3},
            {5,2},{5,1},
            {0,0},{1,0},{2,0},{3,0},{4,0}
        };

        font['E'] = {
            {0,0},{1,0},{2,0},{3,0},{4,0},{5,0},{6,0},
            {0,1},{0,2},{0,3},{0,4},{0,5},{0,6},
            {1,3},{2,3},{3,3},{4,3},{5,3},
            {1,6},{2,6},{3,6},{4,6},{5,6}
        };

        font['D'] = {
            {0,0},{0,1},{0,2},{0,3},{0,4},{0,5},{0,6},
            {1,6},{2,6},{3,6},{4,6},
            {1,0},{2,0},{3,0},{4,0},
            {5,1},{5,2},{5,3},{5,4},{5,5}
        };

        font['C'] = {
            {1,6},{2,6},{3,6},{4,6},{5,6},
            {0,5},{0,4},{0,3},{0,2},{0,1},
            {1,0},{2,0},{3,0},{4,0},{5,0}
        };

        font['L'] = {
            {0,0},{0,1},{0,2},{0,3},{0,4},{0,5},{0,6},
            {1,0},{2,0},{3,0},{4,0},{5,0}
        };

        font['R'] = {
            {0,0},{0,1},{0,2},{0,3},{0,4},{0,5},{0,6},
            {1,6},{2,6},{3,6},{4,5},{4,4},{4,3},
            {1,3},{2,3},{3,3},
            {5,2},{6,1},{6,0}
        };
    }
}
