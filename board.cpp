/**
 * @file board.cpp
 * @brief Board implementation: initialization, queries, setup and hop mechanics.
 */

#include "board.hpp"
#include <sstream>

namespace BGE {

// ===== Static initial layouts (point numbers) ================================
const unsigned char Board::INIT_BLACK[15] = {
    1,1, 12,12,12,12,12, 17,17,17, 19,19,19,19,19
};
const unsigned char Board::INIT_WHITE[15] = {
    24,24, 13,13,13,13,13, 8,8,8, 6,6,6,6,6
};

const char* sideName(Side s) {
    switch (s) {
        case Side::WHITE: return "WHITE";
        case Side::BLACK: return "BLACK";
        default:          return "NONE";
    }
}

// ===== Construction ==========================================================

Board::Board() {
    reset();
}

Board Board::empty() {
    Board b;
    b.clear();
    return b;
}

void Board::clear() {
    for (auto &pt : _points) pt = State::Point{};
    _bar[0]=_bar[1]=0;
    _off[0]=_off[1]=0;
}

void Board::reset() {
    clear();
    for (unsigned i=0; i<15; i++) {
        State::Point &w = _points[INIT_WHITE[i]-1];
        w.side=WHITE; ++w.count;
        State::Point &b = _points[INIT_BLACK[i]-1];
        b.side=BLACK; ++b.count;
    }
}

std::string Board::to_string() const
{
    std::ostringstream os;
    os <<"Board\n" "Point ";
    for (unsigned i=0; i<24; i++) {
        const State::Point &pt(_points[i]);
        if (pt.count==0)
            continue;
        os << i+1 << " " << (pt.side==BLACK ? "B" : "W") << pt.count << " ";
    }
    os << "\nBar W" << _bar[0] << " B" << _bar[1]
       << "  Off W" << _off[0] << " B" << _off[1] << '\n';
    return os.str();
}

void Board::getState(State &s) const
{
    for (unsigned i=0; i<24; i++) {
        s.points[i].count = _points[i].count;
        s.points[i].side  = _points[i].count==0 ? NONE : _points[i].side;
    }
    s.whitebar=_bar[0];
    s.blackbar=_bar[1];
    s.whiteoff=_off[0];
    s.blackoff=_off[1];
}

// ===== Queries ===============================================================

unsigned Board::checkersAt(int point, Side s) const {
    if (!inBoard(point)) return 0U;
    const State::Point &pt = _points[point-1];
    return (pt.count>0 && pt.side==s) ? pt.count : 0U;
}

std::optional<Side> Board::topSide(int point) const {
    if (!inBoard(point)) return std::nullopt;
    const State::Point &pt = _points[point-1];
    if (pt.count==0) return std::nullopt;
    return pt.side;
}

bool Board::isOpen(int point, Side s) const {
    if (!inBoard(point)) return false;
    const State::Point &pt = _points[point-1];
    return pt.count==0 || pt.side==s || pt.count==1;
}

unsigned Board::countBar(Side s) const {
    int idx = sideIndex(s);
    return idx<0 ? 0U : _bar[idx];
}

unsigned Board::countOff(Side s) const {
    int idx = sideIndex(s);
    return idx<0 ? 0U : _off[idx];
}

unsigned Board::total(Side s) const {
    unsigned n = countBar(s) + countOff(s);
    for (int p=1; p<=24; p++) n += checkersAt(p, s);
    return n;
}

bool Board::allInHome(Side s) const {
    if (s==NONE) return false;
    if (countBar(s)>0) return false;
    for (int p=1; p<=24; p++) {
        if (!isHome(s,p) && checkersAt(p,s)>0) return false;
    }
    return true;
}

bool Board::anyFurtherFromHome(Side s, int from) const {
    if (s==WHITE){
        for(int p=from+1;p<=24;p++) if (checkersAt(p,WHITE)>0) return true;
        return false;
    } else {
        for(int p=1;p<from;p++) if (checkersAt(p,BLACK)>0) return true;
        return false;
    }
}

// ===== Position setup ========================================================

void Board::place(int point, Side s, unsigned n) {
    if (!inBoard(point)) throw std::out_of_range("place: point must be 1..24");
    if (s==NONE) throw std::invalid_argument("place: side must be WHITE or BLACK");
    State::Point &pt = _points[point-1];
    if (pt.count>0 && pt.side!=s) throw std::logic_error("place: point held by the other side");
    pt.count = n;
    pt.side  = n==0 ? NONE : s;
}

void Board::setBar(Side s, unsigned n) {
    int idx = sideIndex(s);
    if (idx<0) throw std::invalid_argument("setBar: side must be WHITE or BLACK");
    _bar[idx] = n;
}

void Board::setOff(Side s, unsigned n) {
    int idx = sideIndex(s);
    if (idx<0) throw std::invalid_argument("setOff: side must be WHITE or BLACK");
    _off[idx] = n;
}

// ===== Mechanics =============================================================

Hop Board::applyHop(Side s, const Hop &h) {
    int idx = sideIndex(s);
    if (idx<0) throw std::logic_error("applyHop: no side");

    Hop done = h;
    done.hit = false;
    done.borneOff = !inBoard(h.to);

    // take the checker up
    if (h.from==0) {
        if (_bar[idx]==0) throw std::logic_error("applyHop: bar underflow");
        --_bar[idx];
    } else {
        if (checkersAt(h.from, s)==0) throw std::logic_error("applyHop: no checker at source");
        State::Point &src = _points[h.from-1];
        if (--src.count==0) src.side = NONE;
    }

    if (done.borneOff) {
        ++_off[idx];
        return done;
    }

    State::Point &dst = _points[h.to-1];
    if (dst.count>0 && dst.side!=s) {
        if (dst.count!=1) throw std::logic_error("applyHop: destination blocked");
        ++_bar[sideIndex(dst.side)];
        dst.count = 0;
        done.hit = true;
    }
    dst.side = s;
    ++dst.count;
    return done;
}

std::string Board::key() const {
    std::string k;
    k.reserve(28);
    for (const State::Point &pt : _points) {
        k.push_back(char(pt.count==0 ? 0 : (pt.side==WHITE ? pt.count : 32+pt.count)));
    }
    k.push_back(char(_bar[0])); k.push_back(char(_bar[1]));
    k.push_back(char(_off[0])); k.push_back(char(_off[1]));
    return k;
}

bool Board::operator==(const Board &o) const {
    return key()==o.key();
}

} // namespace BGE
