/**
 * @file TerminalView.h
 * @brief ncurses renderer for Simulation snapshots (cells as glyphs, medium as signed shading).
 *
 * The view only reads Snapshot objects; it never touches the Simulation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "Simulation.h"

#include <ncurses.h>
#include <string>

/**
 * @class TerminalView
 * @brief Draws the visible top-left window of the automaton 1:1 onto the terminal, with a status line.
 */
class TerminalView {
public:
    /** @brief Color pair ids installed by initColors(). */
    enum Pair : short {
        PairMatter = 1,
        PairAntimatter = 2,
        PairWavePos = 3,
        PairWaveNeg = 4,
        PairCursor = 5,
        PairStatus = 6
    };

    explicit TerminalView(WINDOW* win);

    /** @brief Install the color pairs used by the view (no-op without color support). */
    static void initColors();

    /** @brief Redraw the grid area from @p s, skipping the work when its sequence was already drawn. */
    void draw(const Snapshot& s, bool force = false);
    /** @brief Update the bottom status line. */
    void drawStatusLine(const Snapshot& s, bool running, int speedMs);
    /** @brief Show @p note in the status line until replaced. */
    void setStatusNote(const std::string& note) { statusNote = note; }

    /** @brief Paint cursor position in automaton coordinates (shown highlighted). */
    void setCursor(int r, int c) { curRow = r; curCol = c; }
    /** @brief Number of automaton rows/cols that fit on screen (status line excluded). */
    void viewport(int& rows, int& cols) const;

    /** @brief Glyph for a medium amplitude; blank below the visibility floor. */
    static char glyphForAmplitude(float v);
    /** @brief Color pair for a medium amplitude sign. */
    static short pairForAmplitude(float v) { return v >= 0.0f ? PairWavePos : PairWaveNeg; }

private:
    WINDOW* win;               /**< target window (usually stdscr) */
    uint64_t lastSeq{0};       /**< sequence of the last drawn snapshot */
    int curRow{0};             /**< cursor row */
    int curCol{0};             /**< cursor column */
    std::string statusNote;    /**< transient message */
};
