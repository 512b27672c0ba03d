/**
 * @file game.cpp
 * @brief Game state machine implementation.
 */

#include "game.hpp"
#include "rules.hpp"

namespace BGE {

const char* phaseName(Phase p){
    switch(p){ case Phase::OpeningRoll:   return "OpeningRoll";
    case Phase::AwaitingRoll:  return "AwaitingRoll";
    case Phase::AwaitingMoves: return "AwaitingMoves";
    case Phase::GameOver:      return "GameOver"; }
    return "Unknown";
}

Game::Game(Logger* log) : _log(log) {
    startGame();
}

void Game::note(EventType t, const std::string& msg) const {
    if (_log) _log->info(t, _actor==NONE ? "" : sideName(_actor), msg);
}

bool Game::reject(ErrorCode code, const std::string& msg) {
    _lastCode = code;
    _lastErr = msg;
    note(EventType::TurnRejected, std::string(errorName(code)) + " " + msg);
    return false;
}

// ===== Lifecycle =============================================================

void Game::startGame() {
    _board.reset();
    _phase = Phase::OpeningRoll;
    _actor = NONE;
    _dice = Dice();
    _result = GameResult{};
    _lastHops.clear();
    _forfeited = false;
    clearError();
    note(EventType::GameStart, "new game, opening roll");
}

void Game::startGame(Side first) {
    if (first==NONE) throw std::invalid_argument("startGame: first side must be WHITE or BLACK");
    startGame();
    _actor = first;
    _phase = Phase::AwaitingRoll;
}

void Game::startFrom(const Board& b, Side toMove) {
    if (toMove==NONE) throw std::invalid_argument("startFrom: side to move must be WHITE or BLACK");
    if (b.total(WHITE)!=15 || b.total(BLACK)!=15)
        throw std::invalid_argument("startFrom: each side needs 15 checkers");
    startGame(toMove);
    _board = b;
    if (_board.countOff(WHITE)==15 || _board.countOff(BLACK)==15) {
        _result.over = true;
        _result.winner = _board.countOff(WHITE)==15 ? WHITE : BLACK;
        _phase = Phase::GameOver;
    }
    note(EventType::GameStart, "from position " + _board.to_string());
}

// ===== Opening ===============================================================

bool Game::setOpeningDice(int whiteDie, int blackDie) {
    if (_phase!=Phase::OpeningRoll) throw std::logic_error("setOpeningDice: not in OpeningRoll phase");
    if (whiteDie<1||whiteDie>6||blackDie<1||blackDie>6)
        throw std::invalid_argument("setOpeningDice: dice out of range");
    if (whiteDie==blackDie) {
        note(EventType::OpeningRoll, "doubles " + std::to_string(whiteDie) + ", roll again");
        return false;
    }
    Side first = whiteDie>blackDie ? WHITE : BLACK;
    _actor = first;
    note(EventType::OpeningRoll, "W=" + std::to_string(whiteDie) + " B=" + std::to_string(blackDie));
    beginMoving(first, first==WHITE ? Dice(whiteDie, blackDie) : Dice(blackDie, whiteDie));
    return true;
}

// ===== Turn & dice ===========================================================

bool Game::setDice(int d1, int d2) {
    if (_result.over) throw std::logic_error("setDice: game over");
    if (_phase!=Phase::AwaitingRoll) throw std::logic_error("setDice: not in AwaitingRoll phase");
    beginMoving(_actor, Dice(d1, d2));
    return !_forfeited;
}

void Game::beginMoving(Side s, const Dice& d) {
    _actor = s;
    _dice = d;
    _lastHops.clear();
    _forfeited = false;
    clearError();
    note(EventType::Roll, d.to_string());

    if (!Rules::hasAnyLegalMove(_board, s, d.remaining())) {
        _forfeited = true;
        note(EventType::TurnForfeited, "no legal move with " + d.to_string());
        _dice = Dice();
        _actor = opponent(s);
        _phase = Phase::AwaitingRoll;
        return;
    }
    _phase = Phase::AwaitingMoves;
}

bool Game::checkCanMove() {
    if (_result.over) return reject(ErrorCode::GAME_OVER, "submitTurn: game over");
    if (_phase!=Phase::AwaitingMoves) return reject(ErrorCode::WRONG_PHASE, "submitTurn: not in AwaitingMoves phase");
    return true;
}

bool Game::submitTurn(const std::string& notation) {
    if (!checkCanMove()) return false;
    std::vector<MoveRequest> requests;
    try {
        requests = parse(notation);
    } catch (const NotationError& e) {
        return reject(e.code(), e.what());
    }
    return submitTurn(requests);
}

bool Game::submitTurn(Side actor, const std::string& notation) {
    if (_result.over) return reject(ErrorCode::GAME_OVER, "submitTurn: game over");
    if (actor!=_actor) return reject(ErrorCode::OUT_OF_TURN, std::string("submitTurn: ") + sideName(actor) + " is not on turn");
    return submitTurn(notation);
}

bool Game::submitTurn(const std::vector<MoveRequest>& requests) {
    if (!checkCanMove()) return false;

    TurnVerdict v = Rules::validateTurn(_board, _actor, _dice, requests);
    if (!v.accepted) return reject(v.error, v.message);

    _lastHops.clear();
    for (const Hop& h : v.hops) {
        Hop done = _board.applyHop(_actor, h);
        _dice.consume(h.pip);
        _lastHops.push_back(done);
        note(EventType::Move, (done.from==0 ? std::string("bar") : std::to_string(toRelative(_actor, done.from))) + "/" +
                              (done.borneOff ? std::string("off") : std::to_string(toRelative(_actor, done.to))) +
                              (done.hit ? "*" : ""));

        if (_board.total(WHITE)!=15 || _board.total(BLACK)!=15)
            throw std::logic_error("submitTurn: checker count invariant broken");

        if (_board.countOff(_actor)==15) {
            _result.over = true;
            _result.winner = _actor;
            _phase = Phase::GameOver;
            clearError();
            note(EventType::GameOver, std::string(sideName(_actor)) + " wins");
            return true;
        }
    }

    note(EventType::TurnAccepted, format(requests));
    clearError();
    _dice = Dice();
    _actor = opponent(_actor);
    _phase = Phase::AwaitingRoll;
    return true;
}

bool Game::hasAnyLegalMove() const {
    if (_phase!=Phase::AwaitingMoves) return false;
    return Rules::hasAnyLegalMove(_board, _actor, _dice.remaining());
}

std::vector<std::string> Game::hints() const {
    std::vector<std::string> out;
    if (_phase!=Phase::AwaitingMoves) return out;
    for (const Hop& h : Rules::legalHops(_board, _actor, _dice.remaining())) {
        MoveRequest m;
        if (h.from==0)       m.kind = Enter{toRelative(_actor, h.to)};
        else if (h.borneOff) m.kind = BearOff{toRelative(_actor, h.from)};
        else                 m.kind = Normal{toRelative(_actor, h.from), toRelative(_actor, h.to)};
        out.push_back(format(m));
    }
    return out;
}

Game::Snapshot Game::snapshot() const {
    Snapshot s;
    _board.getState(s.board);
    s.toMove = _actor;
    s.phase = _phase;
    s.dice = _dice.remaining();
    s.winner = _result.winner;
    return s;
}

} // namespace BGE
