/**
 * @file game.hpp
 * @brief Turn/game state machine: opening, rolls, turn submission and game end.
 */

#ifndef BGE_GAME_HPP
#define BGE_GAME_HPP

#include <string>
#include <vector>

#include "board.hpp"
#include "dice.hpp"
#include "errors.hpp"
#include "notation.hpp"
#include "logger.hpp"

namespace BGE {

/**
 * @brief Coarse game phase for turn control.
 */
enum class Phase {
    OpeningRoll,   ///< Before the first move: one die each, higher die moves first.
    AwaitingRoll,  ///< The side to move must roll (or set) two dice.
    AwaitingMoves, ///< Dice are set; a full turn must be submitted.
    GameOver       ///< A side has borne off all 15 checkers.
};

const char* phaseName(Phase p);

/**
 * @class Game
 * @brief Owns the Board, the side to move and the current dice.
 *
 * The board only changes through submitTurn() after the legality engine has
 * accepted the whole turn. Rule failures return false with lastError();
 * contract misuse of the roll APIs throws, as documented per method.
 */
class Game
{
public:
    /**
     * @brief Construct a game in OpeningRoll with the standard layout.
     * @param log Optional event log (not owned; may be null).
     */
    explicit Game(Logger* log = nullptr);

    /**
     * @brief Result info once the game has ended.
     */
    struct GameResult {
        bool over=false;     ///< True if the game has ended.
        Side winner=NONE;    ///< Winner side when over==true.
    };

    /**
     * @brief Read-only view for renderers: no rules knowledge needed to draw it.
     */
    struct Snapshot {
        Board::State board;
        Side toMove=NONE;
        Phase phase=Phase::OpeningRoll;
        std::vector<int> dice;   ///< remaining pips
        Side winner=NONE;
    };

    // ===== Lifecycle ==========================================================

    /// Fresh standard board, phase()==OpeningRoll.
    void startGame();

    /// Fresh standard board, skipping the opening: phase()==AwaitingRoll(@p first).
    void startGame(Side first);

    /**
     * @brief Start from an arbitrary position with @p toMove to roll.
     * @throws std::invalid_argument unless each side has exactly 15 checkers.
     */
    void startFrom(const Board& b, Side toMove);

    Phase phase() const { return _phase; }
    Side sideToMove() const { return _actor; }
    const Board& board() const { return _board; }
    const Dice& dice() const { return _dice; }
    bool gameOver() const { return _result.over; }
    GameResult result() const { return _result; }

    // ===== Opening ============================================================

    /**
     * @brief Supply the opening throw (one die per side).
     * @return true if resolved (the higher side now moves with both dice);
     *         false on doubles, which must be thrown again.
     * @throws std::invalid_argument on out-of-range values.
     * @throws std::logic_error if phase()!=OpeningRoll.
     */
    bool setOpeningDice(int whiteDie, int blackDie);

    // ===== Turn & dice ========================================================

    /// True if a dice roll is required next.
    bool needsRoll() const { return _phase==Phase::AwaitingRoll; }

    /**
     * @brief Provide the roll for the side to move.
     * @return true if moves are now awaited; false if no legal move existed and
     *         the turn passed straight to the opponent.
     * @throws std::invalid_argument on out-of-range values.
     * @throws std::logic_error if phase()!=AwaitingRoll or the game is over.
     */
    bool setDice(int d1, int d2);

    /**
     * @brief Parse, validate and apply a whole turn for the side to move.
     * @return true if accepted and applied; false otherwise (see lastError()).
     */
    bool submitTurn(const std::string& notation);

    /// As above, but rejects with OUT_OF_TURN unless @p actor is to move.
    bool submitTurn(Side actor, const std::string& notation);

    bool submitTurn(const std::vector<MoveRequest>& requests);

    /// True if the side to move has at least one legal hop with the remaining dice.
    bool hasAnyLegalMove() const;

    /// Legal single hops right now, in the mover's notation ("13/7", "bar/22", "3/off").
    std::vector<std::string> hints() const;

    Snapshot snapshot() const;

    /// Hops applied by the last accepted turn.
    const std::vector<Hop>& lastTurn() const { return _lastHops; }

    /// True if the last setDice()/setOpeningDice() forfeited the turn.
    bool lastTurnForfeited() const { return _forfeited; }

    ErrorCode lastErrorCode() const { return _lastCode; }

    /// Return a human-readable explanation of the last failure.
    std::string lastError() const { return _lastErr; }

private:
    Board _board;
    Phase _phase = Phase::OpeningRoll;
    Side  _actor = NONE;             ///< side to move; NONE during OpeningRoll
    Dice  _dice;
    GameResult _result{};
    ErrorCode _lastCode = ErrorCode::NONE;
    std::string _lastErr;
    std::vector<Hop> _lastHops;
    bool _forfeited = false;
    Logger* _log = nullptr;

    bool reject(ErrorCode code, const std::string& msg);
    /// GAME_OVER / WRONG_PHASE rejection, checked before any parsing.
    bool checkCanMove();
    void clearError() { _lastCode=ErrorCode::NONE; _lastErr.clear(); }
    void beginMoving(Side s, const Dice& d);
    void note(EventType t, const std::string& msg) const;
};

} // namespace BGE

#endif // BGE_GAME_HPP
