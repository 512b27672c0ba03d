/**
 * @file boardrenderer.cpp
 * @brief Implementation of the ASCII board renderer.
 */

#include "boardrenderer.hpp"

namespace BGE {

using namespace layout;

BoardRenderer::BoardRenderer() {
    drawFrame();
}

void BoardRenderer::drawFrame() {
    _image.assign(kHeight, std::string(kWidth, ' '));

    _image[Y_TOP]    = std::string(kWidth, '-');
    _image[Y_BOTTOM] = std::string(kWidth, '-');

    for (int y=Y_TOP+1; y<Y_BOTTOM; ++y) {
        std::string &row = _image[y];
        if (y==Y_MID) row = std::string(kWidth, '=');
        for (int x : {X_LEFT, X_BAR_LEFT, X_BAR_RIGHT, X_OFF_RAIL, X_RIGHT}) row[x] = '|';
    }
}

void BoardRenderer::drawLabels() {
    for (int r=13; r<=24; ++r) {
        Origin o = pointOrigin(r);
        _image[0][o.x] = char('0' + r/10);
        _image[1][o.x] = char('0' + r%10);
    }
    for (int r=1; r<=12; ++r) {
        Origin o = pointOrigin(r);
        if (r>=10) _image[15][o.x] = '1';
        _image[16][o.x] = char('0' + r%10);
    }
}

/**
 * @brief Draw a single stack of checkers or a count at a given origin.
 *
 * Always writes exactly five cells so nothing from an earlier frame survives.
 */
void BoardRenderer::renderPoint(Side s, unsigned cnt, const Origin &o){
    char ch = s==BLACK ? BC : s==WHITE ? WC : NC;
    int y=o.y;
    for (char c : stackCells(cnt, o.dir)) {
        _image[y][o.x] = (c==CHECKER ? ch : c);
        y = advance(y, o.dir);
    }
}

void BoardRenderer::render(const Board::State &s, Side perspective) {
    if (perspective==NONE) perspective = WHITE;
    drawFrame(); // reset before drawing
    drawLabels();
    _status.clear();

    for (int r=1; r<=24; ++r) {
        const Board::State::Point &pt = s.points[toAbsolute(perspective, r)-1];
        renderPoint(pt.side, pt.count, pointOrigin(r));
    }

    Side opp = opponent(perspective);
    unsigned bar[2] = {s.whitebar, s.blackbar}, off[2] = {s.whiteoff, s.blackoff};
    renderPoint(perspective, bar[perspective==WHITE?0:1], OWN_BAR);
    renderPoint(opp,         bar[opp==WHITE?0:1],         OPP_BAR);
    renderPoint(perspective, off[perspective==WHITE?0:1], OWN_OFF);
    renderPoint(opp,         off[opp==WHITE?0:1],         OPP_OFF);
}

void BoardRenderer::render(const Game::Snapshot &snap) {
    render(snap.board, snap.toMove);

    std::string line;
    if (snap.phase==Phase::GameOver) {
        line = std::string("*** ") + sideName(snap.winner) + " wins ***";
    } else if (snap.phase==Phase::OpeningRoll) {
        line = "opening roll";
    } else {
        line = std::string(sideName(snap.toMove)) + " (" + (snap.toMove==WHITE ? WC : BC) + ") "
             + (snap.phase==Phase::AwaitingRoll ? "to roll" : "to move");
        if (!snap.dice.empty()) {
            line += "  dice:";
            for (int d : snap.dice) line += " " + std::to_string(d);
        }
    }
    _status.push_back(line);
}

/**
 * @brief Print the current ASCII image.
 * @param os Output stream to receive the image.
 */
void BoardRenderer::print(std::ostream &os) const {
    for(const std::string &str: _image){
        os << str << '\n';
    }
    for(const std::string &str: _status){
        os << str << '\n';
    }
}

char BoardRenderer::at(int x, int y) const {
    if (y<0 || y>=(int)_image.size() || x<0 || x>=(int)_image[y].size()) return ' ';
    return _image[y][x];
}

} // namespace BGE
