#ifndef BLOCKROLL_BLOCK_FONT_HPP
#define BLOCKROLL_BLOCK_FONT_HPP

#include <map>
#include <vector>

// ============================================================================
// TEXT MODULE (banner letters built from square cells)
// ============================================================================

namespace BlockFont {
    struct GlyphCell {
        int x, y;   // y = 0 is the bottom row
    };

    // Each character is a list of filled cells
    typedef std::vector<GlyphCell> Glyph;

    extern std::map<char, Glyph> font;

    void init();
}

#endif
