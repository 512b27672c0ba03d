/**
 * @file boardlayout.hpp
 * @brief Screen geometry shared by the ASCII and ncurses renderers.
 *
 * The board is drawn from one side's perspective: the viewer's home board is
 * bottom right, relative points 1..12 run right-to-left along the bottom and
 * 13..24 left-to-right along the top, so the labels match the notation the
 * viewer types.
 */

#ifndef BGE_BOARDLAYOUT_HPP
#define BGE_BOARDLAYOUT_HPP

#include <array>

namespace BGE {
namespace layout {

/**
 * @enum Dir
 * @brief Drawing direction for a point stack.
 *
 * UP   = draw towards decreasing y (lower half)
 * DOWN = draw towards increasing y (upper half)
 */
enum class Dir { UP, DOWN };

/**
 * @struct Origin
 * @brief Starting coordinate and direction for drawing a stack.
 */
struct Origin { Dir dir; int x, y; };

// Row guide (0-based):
//   0..1  : top labels (points 13..24)
//   2     : top border
//   3..7  : upper interior (5 rows)
//   8     : center line
//   9..13 : lower interior (5 rows)
//   14    : bottom border
//   15..16: bottom labels (points 12..1)
constexpr int kHeight = 17;
constexpr int kWidth  = 30;

constexpr int X_LEFT      = 0;   ///< left border
constexpr int X_BAR_LEFT  = 13;  ///< left rail of the bar
constexpr int X_BAR       = 14;  ///< bar lane
constexpr int X_BAR_RIGHT = 15;  ///< right rail of the bar
constexpr int X_OFF_RAIL  = 27;  ///< left edge of the bear-off gutter
constexpr int X_OFF       = 28;  ///< bear-off lane
constexpr int X_RIGHT     = 29;  ///< right border

constexpr int Y_TOP    = 2;
constexpr int Y_MID    = 8;
constexpr int Y_BOTTOM = 14;

/// Glyph marker in stackCells() output.
constexpr char CHECKER = '*';

// Bars and off ladders, relative to the viewer. Each stays inside its half.
constexpr Origin OWN_BAR = {Dir::UP,   X_BAR, 7};   // rows 7..3
constexpr Origin OPP_BAR = {Dir::DOWN, X_BAR, 9};   // rows 9..13
constexpr Origin OPP_OFF = {Dir::DOWN, X_OFF, 3};   // rows 3..7
constexpr Origin OWN_OFF = {Dir::UP,   X_OFF, 13};  // rows 13..9

/// Origin of the viewer's relative point @p rel (1..24).
Origin pointOrigin(int rel);

/**
 * @brief Contents of the five cells of a stack, from the origin outwards.
 *
 *  - 0..5  checkers: first @p cnt cells CHECKER, the rest spaces.
 *  - 6..9  checkers: 4 CHECKER + a single digit.
 *  - 10+   checkers: 3 CHECKER + two digits (top-to-bottom digits depend on direction).
 */
std::array<char,5> stackCells(unsigned cnt, Dir dir);

/// Step one cell away from the origin.
inline int advance(int y, Dir dir) { return dir==Dir::UP ? y-1 : y+1; }

} // namespace layout
} // namespace BGE

#endif // BGE_BOARDLAYOUT_HPP
