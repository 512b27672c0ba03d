/**
 * @file ncurses_renderer.hpp
 * @brief UTF-8 ncurses renderer for BGE::Board::State (narrow-char API).
 */
#ifndef BGE_NCURSES_RENDERER_HPP
#define BGE_NCURSES_RENDERER_HPP

#include <string>
#include <curses.h>   // macOS-friendly
#include "board.hpp"
#include "boardlayout.hpp"

namespace BGE {

class NcursesRenderer {
public:
    explicit NcursesRenderer(WINDOW* win);

    /// Draw @p s seen by @p perspective (labels in that side's numbering).
    void render(const Board::State& s, Side perspective);
    bool checkSize() const;

    static constexpr int kHeight = layout::kHeight;
    static constexpr int kWidth  = layout::kWidth;

    // Color pairs (shared with the status lines drawn by the REPL)
    static constexpr short CP_WHITE = 1;
    static constexpr short CP_BLACK = 2;
    static constexpr short CP_BORDER= 3;
    static constexpr short CP_TEXT  = 4;

    /// Register the color pairs; call once after initscr().
    static void initColors();

private:
    WINDOW* _win;

    // UTF-8 glyphs (plain narrow strings)
    const char* WCHK = "○"; // white checker
    const char* BCHK = "●"; // black checker
    const char* EMPTY= " "; // eraser

    // Utilities
    static void put(WINDOW* w, int y, int x, const char* s, short color_pair=0);
    static void putch(WINDOW* w, int y, int x, char ch, short color_pair=0);

    void drawChrome(); // borders, separators, numbers
    void drawStack(Side side, unsigned cnt, const layout::Origin& o);
};

} // namespace BGE

#endif // BGE_NCURSES_RENDERER_HPP
