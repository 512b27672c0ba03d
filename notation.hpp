/**
 * @file notation.hpp
 * @brief Standard backgammon move notation ("24/18 13/11", "bar/22", "6/off", "8/3/1").
 */

#ifndef BGE_NOTATION_HPP
#define BGE_NOTATION_HPP

#include <string>
#include <vector>
#include <variant>

#include "errors.hpp"

namespace BGE {

/// Relative stop numbers used for the bar and the off-area.
constexpr int BAR_STOP = 25;
constexpr int OFF_STOP = 0;

/**
 * @brief Elementary move kinds. Points are in the mover's own numbering (1..24).
 */
struct Enter   { int to=0;          bool operator==(const Enter&) const = default; };
struct Normal  { int from=0, to=0;  bool operator==(const Normal&) const = default; };
struct BearOff { int from=0;        bool operator==(const BearOff&) const = default; };

using MoveKind = std::variant<Enter, Normal, BearOff>;

/**
 * @struct MoveRequest
 * @brief One elementary step of a turn as typed by the player.
 *
 * @var MoveRequest::kind  What moves where.
 * @var MoveRequest::group Index of the whitespace-separated group it came from;
 *                         hops of one chain ("8/3/1") share a group.
 */
struct MoveRequest {
    MoveKind kind;
    unsigned group=0;

    /// Origin in relative numbering, BAR_STOP for Enter.
    int origin() const;
    /// Destination in relative numbering, OFF_STOP for BearOff.
    int destination() const;

    bool operator==(const MoveRequest&) const = default;
};

/**
 * @brief Parse a full turn.
 *
 * Whitespace separates independent moves; '/' chains stops of one checker and
 * each consecutive pair of stops becomes one MoveRequest. Empty input yields an
 * empty sequence.
 *
 * @throws NotationError with MALFORMED_NOTATION, INVALID_POINT or INVALID_KEYWORD.
 */
std::vector<MoveRequest> parse(const std::string& text);

/// "from/to" text for one request.
std::string format(const MoveRequest& m);

/// Requests joined with spaces (chains are not re-collapsed).
std::string format(const std::vector<MoveRequest>& ms);

} // namespace BGE

#endif // BGE_NOTATION_HPP
