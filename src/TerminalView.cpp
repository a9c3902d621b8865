/**
 * @file TerminalView.cpp
 * @brief TerminalView implementation: full-frame snapshot drawing and status line.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "TerminalView.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <vector>

namespace {
/** @brief One prepared screen cell. */
struct Glyph {
    chtype ch;
    short pair;
    bool bold;
};
}

TerminalView::TerminalView(WINDOW* w) : win(w) {}

void TerminalView::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    init_pair(PairMatter, COLOR_GREEN, -1);
    init_pair(PairAntimatter, COLOR_MAGENTA, -1);
    init_pair(PairWavePos, COLOR_BLUE, -1);
    init_pair(PairWaveNeg, COLOR_RED, -1);
    init_pair(PairCursor, COLOR_BLACK, COLOR_YELLOW);
    init_pair(PairStatus, COLOR_CYAN, -1);
}

char TerminalView::glyphForAmplitude(float v) {
    float a = std::isfinite(v) ? std::fabs(v) : 0.0f;
    if (a < 0.05f) return ' ';
    if (a < 0.2f) return '.';
    if (a < 0.5f) return ':';
    if (a < 1.0f) return '+';
    return '*';
}

void TerminalView::viewport(int& rows, int& cols) const {
    int h = 0, w = 0;
    if (win) getmaxyx(win, h, w);
    rows = std::max(0, h - 1);
    cols = std::max(0, w);
}

void TerminalView::draw(const Snapshot& s, bool force) {
    if (!win) return;
    if (!force && s.seq == lastSeq) return;
    lastSeq = s.seq;

    int vRows = 0, vCols = 0;
    viewport(vRows, vCols);
    const int rows = std::min(vRows, s.topology.rows);
    const int cols = std::min(vCols, s.topology.cols);

    std::vector<Glyph> frame((size_t)std::max(0, rows * cols), Glyph{(chtype)' ', 0, false});

    // Medium shading underneath, nearest medium cell per automaton cell.
    if (s.mediumMode != MediumMode::Off && s.mediumWidth > 0 && s.mediumHeight > 0 &&
        (int)s.amplitude.size() == s.mediumWidth * s.mediumHeight) {
        for (int r = 0; r < rows; ++r) {
            const int y = (int)((long long)r * s.mediumHeight / s.topology.rows);
            for (int c = 0; c < cols; ++c) {
                const int x = (int)((long long)c * s.mediumWidth / s.topology.cols);
                const float v = s.amplitude[(size_t)(y * s.mediumWidth + x)];
                const char g = glyphForAmplitude(v);
                if (g == ' ') continue;
                frame[(size_t)(r * cols + c)] = Glyph{(chtype)g, pairForAmplitude(v), false};
            }
        }
    }

    auto overlay = [&](const std::vector<int>& keys, chtype ch, short pair) {
        for (int k : keys) {
            const int r = k / s.topology.cols;
            const int c = k % s.topology.cols;
            if (r >= rows || c >= cols) continue;
            frame[(size_t)(r * cols + c)] = Glyph{ch, pair, true};
        }
    };
    overlay(s.matter, (chtype)'O', PairMatter);
    if (s.antimatterEnabled) overlay(s.antimatter, (chtype)'X', PairAntimatter);

    werase(win);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const Glyph& g = frame[(size_t)(r * cols + c)];
            if (g.ch == (chtype)' ') continue;
            chtype attr = g.pair ? COLOR_PAIR(g.pair) : 0;
            if (g.bold) attr |= A_BOLD;
            mvwaddch(win, r, c, g.ch | attr);
        }
    }
    if (curRow >= 0 && curRow < rows && curCol >= 0 && curCol < cols) {
        const Glyph& g = frame[(size_t)(curRow * cols + curCol)];
        mvwaddch(win, curRow, curCol, g.ch | COLOR_PAIR(PairCursor));
    }
    wnoutrefresh(win);
}

void TerminalView::drawStatusLine(const Snapshot& s, bool running, int speedMs) {
    if (!win) return;
    int rows, cols;
    getmaxyx(win, rows, cols);
    int y = rows - 1;
    wmove(win, y, 0);
    wclrtoeol(win);

    char status[320];
    snprintf(status, sizeof(status),
             "gen %llu  O:%zu X:%zu  E:%.2f avg:%+.3f  nuc:%llu  ann:%llu  %s %dms %s %s | [s]tart [p]ause [n]ext [r]and [c]lear [w]rap [m]edium [a]nti [1-5] pat [q]uit",
             (unsigned long long)s.generation, s.matter.size(), s.antimatter.size(),
             s.mediumEnergy, s.mediumMean,
             (unsigned long long)s.totalNuclei, (unsigned long long)s.consumedAnnihilations,
             running ? "RUNNING" : "PAUSED", speedMs,
             s.topology.wrap ? "torus" : "bounded",
             s.mediumMode == MediumMode::Off ? "medium:off" : "medium:on");
    std::string line(status);
    if (!statusNote.empty()) line = statusNote + " | " + line;
    if ((int)line.size() > cols) line.resize((size_t)std::max(0, cols));
    wattron(win, COLOR_PAIR(PairStatus));
    mvwprintw(win, y, 0, "%s", line.c_str());
    wattroff(win, COLOR_PAIR(PairStatus));
    wnoutrefresh(win);
}
