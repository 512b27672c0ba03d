/**
 * @file rules.hpp
 * @brief Move legality engine: single hops, chained requests and whole-turn validation.
 */

#ifndef BGE_RULES_HPP
#define BGE_RULES_HPP

#include <string>
#include <vector>
#include <unordered_map>

#include "board.hpp"
#include "dice.hpp"
#include "errors.hpp"
#include "notation.hpp"

namespace BGE {

/**
 * @struct TurnVerdict
 * @brief Outcome of Rules::validateTurn().
 *
 * When accepted, @c board is the position after the whole turn and @c hops
 * lists the single-die hops that produce it, in order. When rejected, @c error
 * names the failed rule and @c failedRequest the offending request (equal to
 * the number of requests for turn-level failures).
 */
struct TurnVerdict {
    bool accepted=false;
    Board board;
    std::vector<Hop> hops;
    std::vector<int> consumed;   ///< dice values used, in play order
    std::vector<int> remaining;  ///< dice values left over

    ErrorCode error=ErrorCode::NONE;
    std::size_t failedRequest=0;
    std::string message;
};

/**
 * @class Rules
 * @brief Stateless legality checks. Never mutates the board it is given.
 */
class Rules
{
public:
    /**
     * @brief Legality of one single-die hop.
     * @param b    Position.
     * @param s    Side to move.
     * @param from Absolute point 1..24, or 0 for the bar.
     * @param pip  Die value.
     * @param[out] out The hop (destination, hit, bear-off) when legal.
     * @return ErrorCode::NONE if legal, otherwise the rule that fails.
     *
     * Order: bar priority, origin, destination/bear-off.
     */
    static ErrorCode checkHop(const Board &b, Side s, int from, int pip, Hop &out);

    /**
     * @brief Validate a complete turn.
     *
     * Each request is resolved into one or more single-die hops (a request whose
     * distance matches no single die may combine dice when every intermediate
     * landing point is open). All resolutions are searched; the first one that
     * plays every request and uses as many dice as any legal play could use is
     * accepted.
     */
    static TurnVerdict validateTurn(const Board &b, Side s, const Dice &dice,
                                    const std::vector<MoveRequest> &requests);

    /// Most dice any sequence of legal hops can use from this position.
    static unsigned maxPlayableDice(const Board &b, Side s, const std::vector<int> &dice);

    /// Every single-die hop legal right now (one per distinct origin/pip pair).
    static std::vector<Hop> legalHops(const Board &b, Side s, const std::vector<int> &dice);

    /// True if at least one die can be played.
    static bool hasAnyLegalMove(const Board &b, Side s, const std::vector<int> &dice);

private:
    /// One way of playing a request: position after it, hops, dice used.
    struct Resolution {
        Board board;
        std::vector<Hop> hops;
        std::vector<int> used;
        std::vector<int> left;
    };

    struct Search;

    static ErrorCode resolveRequest(const Board &b, Side s, const std::vector<int> &dice,
                                    const MoveRequest &m, std::vector<Resolution> &out,
                                    std::string &msg);

    static void diceSequences(std::vector<int> pool, std::vector<int> &cur,
                              std::vector<std::vector<int>> &out);

    static unsigned dfsMax(const Board &b, Side s, const std::vector<int> &dice,
                           std::unordered_map<std::string, unsigned> &memo);
};

} // namespace BGE

#endif // BGE_RULES_HPP
