/**
 * @file boardlayout.cpp
 * @brief Point origins and stack cell contents.
 */

#include "boardlayout.hpp"

namespace BGE {
namespace layout {

Origin pointOrigin(int rel) {
    if (rel<=6)  return {Dir::UP,   26 - 2*(rel-1),  13};
    if (rel<=12) return {Dir::UP,   11 - 2*(rel-7),  13};
    if (rel<=18) return {Dir::DOWN,  1 + 2*(rel-13),  3};
    return              {Dir::DOWN, 16 + 2*(rel-19),  3};
}

std::array<char,5> stackCells(unsigned cnt, Dir dir) {
    std::array<char,5> cells;
    cells.fill(' ');

    if (cnt<=5) {
        for (unsigned i=0; i<cnt; ++i) cells[i] = CHECKER;
        return cells;
    }

    if (cnt<10) {
        for (unsigned i=0; i<4; ++i) cells[i] = CHECKER;
        cells[4] = char('0'+cnt);
        return cells;
    }

    // tens then ones along the screen, so reversed when drawing upwards
    char tens = char('0'+(cnt/10)), ones = char('0'+(cnt%10));
    for (unsigned i=0; i<3; ++i) cells[i] = CHECKER;
    cells[3] = (dir==Dir::UP ? ones : tens);
    cells[4] = (dir==Dir::UP ? tens : ones);
    return cells;
}

} // namespace layout
} // namespace BGE
