/**
 * @file rules.cpp
 * @brief Legality engine implementation: hop checks, request resolution, turn search.
 */

#include "rules.hpp"
#include <algorithm>

namespace BGE {

// ===== single hop ============================================================

ErrorCode Rules::checkHop(const Board &b, Side s, int from, int pip, Hop &out) {
    if (b.countBar(s)>0 && from!=0) return ErrorCode::MUST_ENTER_FROM_BAR;

    if (from==0) {
        if (b.countBar(s)==0) return ErrorCode::NO_CHECKER_AT_ORIGIN;
    } else {
        if (b.checkersAt(from, s)==0) return ErrorCode::NO_CHECKER_AT_ORIGIN;
    }

    int to = Board::destPoint(s, from, pip);
    bool borne=false, hit=false;

    if (Board::inBoard(to)) {
        if (!b.isOpen(to, s)) return ErrorCode::BLOCKED_DESTINATION;
        auto owner = b.topSide(to);
        hit = owner && *owner!=s;
    } else {
        if (!b.allInHome(s)) return ErrorCode::ILLEGAL_BEAR_OFF;
        // a larger die may only bear off from the highest occupied point
        bool exact = s==WHITE ? from==pip : from==25-pip;
        if (!exact && b.anyFurtherFromHome(s, from)) return ErrorCode::ILLEGAL_BEAR_OFF;
        borne=true;
    }

    out = Hop{from, to, pip, hit, borne};
    return ErrorCode::NONE;
}

// ===== request resolution ====================================================

void Rules::diceSequences(std::vector<int> pool, std::vector<int> &cur,
                          std::vector<std::vector<int>> &out) {
    std::sort(pool.begin(), pool.end());
    for (std::size_t i=0; i<pool.size(); ++i) {
        if (i>0 && pool[i]==pool[i-1]) continue;
        std::vector<int> rest = pool;
        rest.erase(rest.begin()+i);
        cur.push_back(pool[i]);
        out.push_back(cur);
        diceSequences(rest, cur, out);
        cur.pop_back();
    }
}

ErrorCode Rules::resolveRequest(const Board &b, Side s, const std::vector<int> &dice,
                                const MoveRequest &m, std::vector<Resolution> &out,
                                std::string &msg) {
    const std::string what = format(m);
    const bool entering = std::holds_alternative<Enter>(m.kind);
    const bool bearing  = std::holds_alternative<BearOff>(m.kind);

    if (b.countBar(s)>0 && !entering) {
        msg = what + ": must enter from bar first";
        return ErrorCode::MUST_ENTER_FROM_BAR;
    }

    int from = entering ? 0 : toAbsolute(s, m.origin());
    if ((entering && b.countBar(s)==0) || (!entering && b.checkersAt(from, s)==0)) {
        msg = what + ": no checker at source";
        return ErrorCode::NO_CHECKER_AT_ORIGIN;
    }

    if (bearing) {
        // everything but the moving checker must already be home
        Board rest = b;
        rest.place(from, s, b.checkersAt(from, s)-1);
        if (!rest.allInHome(s)) {
            msg = what + ": cannot bear off, not all checkers in home";
            return ErrorCode::ILLEGAL_BEAR_OFF;
        }
    }

    const int distance = m.origin() - m.destination();
    if (distance<=0) {
        msg = what + ": moves backwards or nowhere";
        return ErrorCode::ILLEGAL_DISTANCE;
    }

    std::vector<std::vector<int>> seqs;
    std::vector<int> cur;
    diceSequences(dice, cur, seqs);
    std::stable_sort(seqs.begin(), seqs.end(),
                     [](const std::vector<int>& a, const std::vector<int>& c){ return a.size()<c.size(); });

    bool covered=false;
    ErrorCode firstErr=ErrorCode::NONE;

    for (const std::vector<int> &seq : seqs) {
        int sum=0;
        for (int d : seq) sum+=d;
        int beforeLast = sum-seq.back();
        if (bearing) {
            if (sum<distance || beforeLast>=distance) continue;
        } else {
            if (sum!=distance) continue;
        }
        covered=true;

        Resolution r{b, {}, {}, dice};
        int pos = from;
        ErrorCode e = ErrorCode::NONE;
        for (int pip : seq) {
            Hop h;
            e = checkHop(r.board, s, pos, pip, h);
            if (e!=ErrorCode::NONE) break;
            h = r.board.applyHop(s, h);
            r.hops.push_back(h);
            r.used.push_back(pip);
            r.left.erase(std::find(r.left.begin(), r.left.end(), pip));
            pos = h.to;
        }

        if (e==ErrorCode::NONE) out.push_back(std::move(r));
        else if (firstErr==ErrorCode::NONE) firstErr=e;
    }

    if (!out.empty()) return ErrorCode::NONE;

    if (!covered) {
        msg = what + ": no available dice cover " + std::to_string(distance) + " pips";
        return ErrorCode::ILLEGAL_DISTANCE;
    }

    switch (firstErr) {
        case ErrorCode::BLOCKED_DESTINATION: msg = what + ": destination blocked"; break;
        case ErrorCode::ILLEGAL_BEAR_OFF:    msg = what + ": must use exact roll or bear off highest checker"; break;
        case ErrorCode::MUST_ENTER_FROM_BAR: msg = what + ": must enter all checkers from bar first"; break;
        default:                             msg = what + ": " + errorName(firstErr); break;
    }
    return firstErr;
}

// ===== turn search ===========================================================

struct Rules::Search {
    Side side;
    const std::vector<MoveRequest> &reqs;
    std::vector<int> startDice;
    unsigned maxUse=0;
    bool highOnlyPlayable=false;   ///< only one die playable and the higher one can be

    bool haveFailure=false;
    std::size_t failDepth=0;
    ErrorCode failErr=ErrorCode::NONE;
    std::string failMsg;

    void fail(std::size_t depth, ErrorCode e, const std::string &msg) {
        if (haveFailure && depth<=failDepth) return;
        haveFailure=true; failDepth=depth; failErr=e; failMsg=msg;
    }

    bool run(const Board &b, const std::vector<int> &dice, std::size_t idx,
             std::vector<Hop> &hops, std::vector<int> &used, TurnVerdict &out) {
        if (idx==reqs.size()) {
            if (used.size()<maxUse) {
                fail(idx, ErrorCode::INCOMPLETE_TURN,
                     "must use maximum number of dice (" + std::to_string(used.size()) +
                     " of " + std::to_string(maxUse) + ")");
                return false;
            }
            if (highOnlyPlayable && used.size()==1 &&
                used[0]!=*std::max_element(startDice.begin(), startDice.end())) {
                fail(idx, ErrorCode::HIGHER_DIE_REQUIRED, "only one die playable; must use the higher die");
                return false;
            }
            out.accepted=true;
            out.board=b;
            out.hops=hops;
            out.consumed=used;
            out.remaining=dice;
            return true;
        }

        std::vector<Resolution> options;
        std::string msg;
        ErrorCode e = resolveRequest(b, side, dice, reqs[idx], options, msg);
        if (e!=ErrorCode::NONE) {
            fail(idx, e, msg);
            return false;
        }

        for (const Resolution &r : options) {
            std::size_t h0=hops.size(), u0=used.size();
            hops.insert(hops.end(), r.hops.begin(), r.hops.end());
            used.insert(used.end(), r.used.begin(), r.used.end());
            if (run(r.board, r.left, idx+1, hops, used, out)) return true;
            hops.resize(h0);
            used.resize(u0);
        }
        return false;
    }
};

TurnVerdict Rules::validateTurn(const Board &b, Side s, const Dice &dice,
                                const std::vector<MoveRequest> &requests) {
    TurnVerdict v;
    v.board = b;

    Search search{s, requests, dice.remaining()};
    search.maxUse = maxPlayableDice(b, s, dice.remaining());

    const std::vector<int> &sd = search.startDice;
    if (search.maxUse==1 && sd.size()==2 && sd[0]!=sd[1]) {
        int hi = std::max(sd[0], sd[1]);
        search.highOnlyPlayable = maxPlayableDice(b, s, {hi})>0;
    }

    std::vector<Hop> hops;
    std::vector<int> used;
    if (search.run(b, dice.remaining(), 0, hops, used, v)) return v;

    v.accepted=false;
    v.board=b;
    v.error=search.failErr;
    v.failedRequest=search.failDepth;
    v.message=search.failMsg;
    return v;
}

// ===== maximal dice usage ====================================================

unsigned Rules::dfsMax(const Board &b, Side s, const std::vector<int> &dice,
                       std::unordered_map<std::string, unsigned> &memo) {
    if (dice.empty()) return 0;

    std::string key = b.key();
    key.push_back('|');
    for (int d : dice) key.push_back(char('0'+d));
    auto hit = memo.find(key);
    if (hit!=memo.end()) return hit->second;

    unsigned best = 0;
    for (const Hop &h : legalHops(b, s, dice)) {
        Board next = b;
        next.applyHop(s, h);
        std::vector<int> rest = dice;
        rest.erase(std::find(rest.begin(), rest.end(), h.pip));
        unsigned cand = 1 + dfsMax(next, s, rest, memo);
        if (cand>best) best=cand;
        if (best==dice.size()) break;
    }

    memo.emplace(std::move(key), best);
    return best;
}

unsigned Rules::maxPlayableDice(const Board &b, Side s, const std::vector<int> &dice) {
    std::vector<int> sorted = dice;
    std::sort(sorted.begin(), sorted.end());
    std::unordered_map<std::string, unsigned> memo;
    return dfsMax(b, s, sorted, memo);
}

std::vector<Hop> Rules::legalHops(const Board &b, Side s, const std::vector<int> &dice) {
    std::vector<Hop> out;
    if (s==NONE) return out;

    std::vector<int> pips = dice;
    std::sort(pips.begin(), pips.end());
    pips.erase(std::unique(pips.begin(), pips.end()), pips.end());

    std::vector<int> froms;
    if (b.countBar(s)>0) {
        froms.push_back(0);
    } else {
        for (int p=1; p<=24; p++) if (b.checkersAt(p, s)>0) froms.push_back(p);
    }

    for (int pip : pips) {
        for (int from : froms) {
            Hop h;
            if (checkHop(b, s, from, pip, h)==ErrorCode::NONE) out.push_back(h);
        }
    }
    return out;
}

bool Rules::hasAnyLegalMove(const Board &b, Side s, const std::vector<int> &dice) {
    return !legalHops(b, s, dice).empty();
}

} // namespace BGE
