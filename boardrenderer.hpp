/**
 * @file boardrenderer.hpp
 * @brief ASCII renderer for a board snapshot, drawn from one side's perspective.
 */

#ifndef BGE_BOARDRENDERER_HPP
#define BGE_BOARDRENDERER_HPP

#include "board.hpp"
#include "game.hpp"
#include "boardlayout.hpp"
#include <string>
#include <vector>
#include <iostream>

namespace BGE {

/**
 * @class BoardRenderer
 * @brief Renders a Board::State to a fixed-width ASCII art image.
 *
 * Usage:
 * @code
 *   BGE::Game g; BGE::BoardRenderer r;
 *   r.render(g.snapshot()); r.print(std::cout);
 * @endcode
 */
class BoardRenderer
{
public:
    BoardRenderer();

    /**
     * @brief Render a board seen by @p perspective onto the image buffer.
     *
     * Point labels are in @p perspective's own numbering. Call print() to flush
     * the buffer to an output stream.
     */
    void render(const Board::State &s, Side perspective);

    /**
     * @brief Render a game snapshot from the mover's side plus a status line.
     *
     * Before the opening roll the board is shown from WHITE's side.
     */
    void render(const Game::Snapshot &snap);

    /**
     * @brief Write the current ASCII image to an output stream.
     * @param os Target stream (e.g., std::cout).
     */
    void print(std::ostream &os) const;

    /// Character at column @p x, row @p y of the board image (space when outside).
    char at(int x, int y) const;

private:
    /// A 2D ASCII image, one string per row (no newlines).
    typedef std::vector<std::string> Image;

    /// Draw buffer.
    Image _image;

    /// Lines printed under the board.
    std::vector<std::string> _status;

    /// Borders and rails.
    void drawFrame();
    /// Point labels; relative numbering reads the same for either side.
    void drawLabels();

    void renderPoint(Side s, unsigned cnt, const layout::Origin &o);

    /// Characters used when drawing.
    const char
        WC='X', ///< White checker glyph
        BC='O', ///< Black checker glyph
        NC=' '; ///< Empty cell
};

} // namespace BGE

#endif // BGE_BOARDRENDERER_HPP
