#include "ncurses_renderer.hpp"

namespace BGE {

using namespace layout;

// ---- Interior color policy (typed, file-local) ----
// Interior variants: same foregrounds as the public pairs, unified background (kBoardBG)
static constexpr short CP_FIELD      = 5;  // interior fill for "plain space"
static constexpr short CP_WHITE_INT  = 6;
static constexpr short CP_BLACK_INT  = 7;
static constexpr short CP_BORDER_INT = 8;

static constexpr short kBoardBG      = COLOR_BLACK; // change to COLOR_GREEN for "felt"

// Board interior: between the borders, left of the bear-off rail
static inline bool in_board_interior(int y, int x){
    return (y > Y_TOP && y < Y_BOTTOM && x > X_LEFT && x < X_OFF_RAIL);
}

static inline bool inwin_xy(WINDOW* w, int y, int x){
    int h=0, ww=0; getmaxyx(w,h,ww);
    return (y>=0 && y<h && x>=0 && x<ww);
}

NcursesRenderer::NcursesRenderer(WINDOW* win) : _win(win) {}

void NcursesRenderer::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(CP_WHITE,  COLOR_WHITE,  -1);
    init_pair(CP_BLACK,  COLOR_CYAN,   -1);
    init_pair(CP_BORDER, COLOR_YELLOW, -1);
    init_pair(CP_TEXT,   COLOR_GREEN,  -1);

    init_pair(CP_FIELD,      COLOR_WHITE,   kBoardBG);
    init_pair(CP_WHITE_INT,  COLOR_MAGENTA, kBoardBG);
    init_pair(CP_BLACK_INT,  COLOR_CYAN,    kBoardBG);
    init_pair(CP_BORDER_INT, COLOR_YELLOW,  kBoardBG);
}

bool NcursesRenderer::checkSize() const {
    int h=0,w=0; getmaxyx(_win,h,w);
    return (h >= kHeight) && (w >= kWidth);
}

void NcursesRenderer::put(WINDOW* w, int y, int x, const char* s, short cp){
    if (!inwin_xy(w,y,x)) return;

    short eff = cp;
    if (in_board_interior(y, x)) {
        if      (cp == CP_WHITE)  eff = CP_WHITE_INT;
        else if (cp == CP_BLACK)  eff = CP_BLACK_INT;
        else if (cp == CP_BORDER) eff = CP_BORDER_INT;
        else                      eff = CP_FIELD;
    }

    if (eff) wattron(w, COLOR_PAIR(eff));
    mvwaddstr(w, y, x, s);   // UTF-8 via narrow API
    if (eff) wattroff(w, COLOR_PAIR(eff));
}

void NcursesRenderer::putch(WINDOW* w, int y, int x, char ch, short cp){
    char buf[2] = { ch, 0 };
    put(w, y, x, buf, cp);
}

void NcursesRenderer::drawChrome(){
    for (int y=0; y<kHeight; ++y)
        for (int x=0; x<kWidth; ++x)
            put(_win, y, x, " ", 0);

    // ---- Numbers (aligned to point columns, relative to the viewer) ----
    for (int p=13; p<=24; ++p){
        int x = pointOrigin(p).x;
        putch(_win, 0, x, char('0'+p/10), CP_TEXT);
        putch(_win, 1, x, char('0'+p%10), CP_TEXT);
    }
    for (int p=12; p>=1; --p){
        int x = pointOrigin(p).x;
        if (p >= 10) putch(_win, 15, x, '1', CP_TEXT);
        putch(_win, 16, x, char('0'+(p%10)), CP_TEXT);
    }

    // ---- Horizontal borders ----
    for (int x=X_LEFT+1; x<X_RIGHT; ++x){
        put(_win, Y_TOP,    x, "─", CP_BORDER);
        put(_win, Y_BOTTOM, x, "─", CP_BORDER);
        put(_win, Y_MID,    x, "═", CP_BORDER);
    }
    put(_win, Y_TOP,    X_LEFT,  "┌", CP_BORDER);
    put(_win, Y_TOP,    X_RIGHT, "┐", CP_BORDER);
    put(_win, Y_BOTTOM, X_LEFT,  "└", CP_BORDER);
    put(_win, Y_BOTTOM, X_RIGHT, "┘", CP_BORDER);
    put(_win, Y_MID,    X_LEFT,  "╞", CP_BORDER);
    put(_win, Y_MID,    X_RIGHT, "╡", CP_BORDER);

    // ---- Verticals: borders, bar rails, bear-off rail ----
    for (int x : {X_LEFT, X_BAR_LEFT, X_BAR_RIGHT, X_OFF_RAIL, X_RIGHT}){
        for (int y=Y_TOP+1; y<Y_BOTTOM; ++y){
            if (y!=Y_MID) put(_win, y, x, "│", CP_BORDER);
        }
        if (x==X_LEFT || x==X_RIGHT) continue;
        put(_win, Y_TOP,    x, "┬", CP_BORDER);
        put(_win, Y_BOTTOM, x, "┴", CP_BORDER);
        put(_win, Y_MID,    x, "╪", CP_BORDER);
    }
}

void NcursesRenderer::drawStack(Side side, unsigned cnt, const Origin& o){
    const char* glyph = (side==BLACK ? BCHK : (side==WHITE ? WCHK : EMPTY));
    const short cp = (side==WHITE ? CP_WHITE : CP_BLACK);
    int y=o.y;
    for (char c : stackCells(cnt, o.dir)){
        if (c==CHECKER)  put(_win, y, o.x, glyph, cp);
        else if (c==' ') put(_win, y, o.x, EMPTY, 0);
        else             putch(_win, y, o.x, c, cp);
        y = advance(y, o.dir);
    }
}

void NcursesRenderer::render(const Board::State& s, Side perspective){
    if (!checkSize()){
        werase(_win);
        put(_win, 0, 0, "Window too small for board.", CP_TEXT);
        wrefresh(_win);
        return;
    }
    if (perspective==NONE) perspective = WHITE;

    drawChrome();

    for (int r=1; r<=24; ++r){
        const auto &pt = s.points[toAbsolute(perspective, r)-1];
        drawStack(pt.side, pt.count, pointOrigin(r));
    }

    Side opp = opponent(perspective);
    auto barOf = [&](Side x){ return x==WHITE ? s.whitebar : s.blackbar; };
    auto offOf = [&](Side x){ return x==WHITE ? s.whiteoff : s.blackoff; };
    drawStack(perspective, barOf(perspective), OWN_BAR);
    drawStack(opp,         barOf(opp),         OPP_BAR);
    drawStack(perspective, offOf(perspective), OWN_OFF);
    drawStack(opp,         offOf(opp),         OPP_OFF);

    wrefresh(_win);
}

} // namespace BGE
