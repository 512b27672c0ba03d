/**
 * @file board.hpp
 * @brief Core backgammon board model: sides, points, bars, off-areas and hop mechanics.
 */

#ifndef BGE_BOARD_HPP
#define BGE_BOARD_HPP

#include <string>
#include <optional>
#include <stdexcept>

namespace BGE {

/**
 * @enum Side
 * @brief Player side indicator.
 *
 * Values:
 * - WHITE: White player (moves 24→1, home 1..6)
 * - BLACK: Black player (moves 1→24, home 19..24)
 * - NONE : No owner / empty
 */
enum class Side {WHITE=0, BLACK=1, NONE};

/// Convenience constants mirroring Side values (useful in initializers).
const Side WHITE(Side::WHITE), BLACK(Side::BLACK), NONE(Side::NONE);

inline Side opponent(Side s) { return s==WHITE?BLACK : s==BLACK?WHITE : NONE; }

/// "WHITE", "BLACK" or "NONE".
const char* sideName(Side s);

/**
 * @brief Convert a point number in the mover's own numbering to an absolute point.
 *
 * Relative point 1 is the mover's ace point, 24 the farthest point from home.
 * The mapping is its own inverse, so it also converts absolute to relative.
 */
inline int toAbsolute(Side s, int rel) { return s==WHITE ? rel : 25-rel; }
inline int toRelative(Side s, int abs) { return s==WHITE ? abs : 25-abs; }

/**
 * @struct Hop
 * @brief One single-die movement of one checker, in absolute numbering.
 *
 * @var Hop::from     1..24, or 0 to enter from the bar.
 * @var Hop::to       1..24, or outside that range when bearing off.
 * @var Hop::pip      Die value consumed.
 * @var Hop::hit      A lone opposing checker on @c to went to the bar.
 * @var Hop::borneOff The checker left the board.
 */
struct Hop {
    int from=0, to=0, pip=0;
    bool hit=false, borneOff=false;
};

/**
 * @class Board
 * @brief 24 points, two bars and two off-areas, with value semantics.
 *
 * The board never validates moves on its own; the legality engine decides and
 * applyHop() performs the mechanics of an accepted hop.
 */
class Board
{
public:
    /**
     * @brief Construct the board in standard starting position.
     */
    Board();

    /// An empty board (no checkers anywhere) for building positions.
    static Board empty();

    /**
     * @struct Board::State
     * @brief Lightweight, POD-style snapshot of the board for rendering/UI.
     */
    struct State {
        struct Point {
            Side side=NONE; unsigned count=0;
        } points[24];

        /// Checkers on bars and borne off, by side.
        unsigned whitebar=0, blackbar=0, whiteoff=0, blackoff=0;
    };

    /**
     * @brief Fill a State with the current board snapshot.
     * @param[out] s Destination snapshot.
     */
    void getState(State &s) const;

    /**
     * @brief Human-readable summary (occupied points, bars and off-areas).
     */
    std::string to_string() const;

    /// Restore the standard starting position.
    void reset();

    /// Remove every checker.
    void clear();

    // ===== Queries ============================================================

    /// Checkers of @p s on @p point; 0 if the point holds the other side or is out of range.
    unsigned checkersAt(int point, Side s) const;

    /// Owner of @p point, or nullopt when empty.
    std::optional<Side> topSide(int point) const;

    /**
     * @brief True if @p s may land on @p point.
     *
     * A point is open when it is empty, holds only @p s checkers, or holds
     * exactly one opposing checker (which would be hit).
     */
    bool isOpen(int point, Side s) const;

    unsigned countBar(Side s) const;
    unsigned countOff(Side s) const;

    /// Checkers of @p s on points, bar and off together (15 in a real game).
    unsigned total(Side s) const;

    /// True when @p s has nothing on the bar and every checker in home or off.
    bool allInHome(Side s) const;

    /// True when @p s has a checker farther from home than @p from.
    bool anyFurtherFromHome(Side s, int from) const;

    // ===== Position setup =====================================================

    /**
     * @brief Put @p n checkers of @p s on @p point, replacing what @p s had there.
     * @throws std::out_of_range  if @p point is not 1..24.
     * @throws std::logic_error   if the point is held by the other side.
     */
    void place(int point, Side s, unsigned n);

    void setBar(Side s, unsigned n);
    void setOff(Side s, unsigned n);

    // ===== Mechanics ==========================================================

    /**
     * @brief Perform an already-validated hop for @p s.
     * @return The hop as performed (hit/borneOff filled from the board).
     * @throws std::logic_error if the hop would break a board invariant.
     */
    Hop applyHop(Side s, const Hop &h);

    /// Compact signature of the position (used for search memoization).
    std::string key() const;

    bool operator==(const Board &o) const;
    bool operator!=(const Board &o) const { return !(*this==o); }

    // movement math
    static inline int destPoint(Side s, int from, int pip){
        return s==WHITE ? (from==0 ? 25-pip : from-pip)
                        : (from==0 ? pip : from+pip);
    }
    static inline bool inBoard(int p){ return p>=1 && p<=24; }
    static inline bool isHome(Side s, int p){ return s==WHITE ? (p>=1 && p<=6) : (p>=19 && p<=24); }

private:
    // ===== Static initial layout helpers =====================================
    static const unsigned char INIT_BLACK[15];
    static const unsigned char INIT_WHITE[15];

    State::Point _points[24];
    unsigned _bar[2]{}, _off[2]{};

    static int sideIndex(Side s){ return s==WHITE?0 : s==BLACK?1 : -1; }
};

} // namespace BGE

#endif // BGE_BOARD_HPP
