#include "LevelData.hpp"

namespace LevelData {
    namespace {
        const std::vector<LevelDef>& levels() {
            static const std::vector<LevelDef> table = {
                // level 0
                {
                    Cell(5, 1),
                    {
                        "  #####",
                        "  #####",
                        "  #####",
                        " #####",
                        " #####",
                        " #####",
                        "#####",
                        "#O###",
                        "#####",
                    }
                },
                // level 1
                {
                    Cell(1, 1),
                    {
                        "##### #####",
                        "##### ##O##",
                        " ###   ###",
                        " ###   ###",
                        " ###   ###",
                        " #### ####",
                        "   #####",
                        "    ###",
                        "     #",
                    }
                },
                // level 2
                {
                    Cell(1, 1),
                    {
                        " ##",
                        "####",
                        "##O##",
                        " ####",
                        "  ##",
                    }
                },
                // level 3
                {
                    Cell(3, 0),
                    {
                        "#####",
                        "####",
                        "###  ###",
                        "##   #O#",
                        "########",
                        "     ###",
                        "     ###",
                    }
                },
                // level 4
                {
                    Cell(1, 0),
                    {
                        " ####",
                        "    #",
                        "### #",
                        "#####",
                        "#O#",
                        "###",
                    }
                },
                // level 5
                {
                    Cell(0, 0),
                    {
                        "###",
                        "###",
                        "#####",
                        "   ##",
                        "#####",
                        "###",
                        "######",
                        "   #O#",
                        "   ###",
                        "    ##",
                    }
                },
                // level 6
                {
                    Cell(1, 3),
                    {
                        "      #######",
                        "####  ##   ##",
                        "#########  ####",
                        "####       ##O#",
                        "####       ####",
                        "            ###",
                    }
                },
                // level 7
                {
                    Cell(13, 3),
                    {
                        "        ####",
                        "        ####",
                        "###    ##  ####",
                        "#O#    ##   ###",
                        "###   ###   ###",
                        "###   ###   ###",
                        " ###   #",
                        "  ######",
                    }
                },
                // level 8
                {
                    Cell(0, 3),
                    {
                        "     ######",
                        "     #  ###",
                        "     #  #####",
                        "######     ####",
                        "    ###    ##O#",
                        "    ###     ###",
                        "      #  ##",
                        "      #####",
                        "      #####",
                        "       ###",
                    }
                },
                // level 9
                {
                    Cell(2, 7),
                    {
                        "          ####",
                        "############O#",
                        "###        ###",
                        "####",
                        "  ########  ###",
                        "       ########",
                        " ####     #####",
                        " ##########",
                        " ####",
                    }
                },
                // level 10
                {
                    Cell(0, 5),
                    {
                        " ####",
                        " #O##",
                        " ###",
                        " #   ######",
                        " #   ##  ##",
                        "#######  ###",
                        "     #     #",
                        "     ####  #",
                        "     #######",
                        "        ###",
                    }
                },
                // level 11
                {
                    Cell(9, 14),
                    {
                        "",
                        "",
                        "     #### #",
                        "    ########",
                        "    #  #####",
                        "    #    # #",
                        "    #      ####",
                        "   ##    #   ##",
                        "   ##   ###   #",
                        "   ### ##O## ##",
                        "    #   ###   ###",
                        "    ###  #  #####",
                        "   ####  #  ###",
                        "   ####  #    #",
                        "   #    ###  ##",
                        "   ########  ##",
                        "        # ####",
                    }
                },
            };
            return table;
        }
    }

    int count() {
        return (int)levels().size();
    }

    int maxIndex() {
        return count() - 1;
    }

    bool isValidIndex(int index) {
        return index >= 0 && index <= maxIndex();
    }

    const LevelDef& get(int index) {
        return levels()[index];
    }
}
