/**
 * @file AutomatonEngine.cpp
 * @brief AutomatonEngine implementation: sparse B3/S23 stepping for two populations and annihilation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AutomatonEngine.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

/** @copydoc AutomatonEngine::AutomatonEngine */
AutomatonEngine::AutomatonEngine(const GridTopology& t) : topo(t) {
    if (topo.rows < 1) topo.rows = 1;
    if (topo.cols < 1) topo.cols = 1;
}

/** @copydoc AutomatonEngine::annihilateOverlap */
size_t AutomatonEngine::annihilateOverlap(LiveSet& a, LiveSet& b, std::vector<int>* out) {
    if (a.empty() || b.empty()) return 0;
    LiveSet& small = (a.size() <= b.size()) ? a : b;
    LiveSet& big = (a.size() <= b.size()) ? b : a;
    size_t removed = 0;
    for (auto it = small.begin(); it != small.end();) {
        int k = *it;
        if (big.erase(k) == 0) { ++it; continue; }
        if (out) out->push_back(k);
        it = small.erase(it);
        ++removed;
    }
    return removed;
}

/** @copydoc AutomatonEngine::isAlive */
bool AutomatonEngine::isAlive(int r, int c, Population pop) const {
    if (!topo.inBounds(r, c)) return false;
    const LiveSet& s = cells(pop);
    return s.count(topo.key(r, c)) != 0;
}

/** @brief See AutomatonEngine::step; counts neighbours sparsely, only around live cells. */
LiveSet AutomatonEngine::stepPopulation(const LiveSet& current) const {
    std::unordered_map<int, int> counts;
    counts.reserve(current.size() * 8 + 16);
    for (int k : current) {
        const int r = topo.rowOf(k);
        const int c = topo.colOf(k);
        for (int dr = -1; dr <= 1; ++dr) {
            for (int dc = -1; dc <= 1; ++dc) {
                if (dr == 0 && dc == 0) continue;
                int rr = r + dr;
                int cc = c + dc;
                if (!topo.resolve(rr, cc)) continue;
                ++counts[topo.key(rr, cc)];
            }
        }
    }

    LiveSet next;
    next.reserve(current.size() + 16);
    for (const auto& kv : counts) {
        const int n = kv.second;
        if (n == 3 || (n == 2 && current.count(kv.first))) next.insert(kv.first);
    }
    return next;
}

/** @copydoc AutomatonEngine::step */
void AutomatonEngine::step() {
    LiveSet nextLive = stepPopulation(live);
    LiveSet nextAnti = stepPopulation(antiLive);
    live.swap(nextLive);
    antiLive.swap(nextAnti);
    resolveOverlap(true);
    ++gen;
    ++redraw;
}

/** @copydoc AutomatonEngine::paintCell */
void AutomatonEngine::paintCell(int r, int c, PaintMode mode) {
    if (!topo.inBounds(r, c)) return;
    const int k = topo.key(r, c);
    if (mode == PaintMode::Add) live.insert(k);
    else live.erase(k);
    // Manual drawing never feeds the medium.
    resolveOverlap(false);
    ++redraw;
}

/** @copydoc AutomatonEngine::addCells */
size_t AutomatonEngine::addCells(const CellBatch& batch, LiveSet& target) const {
    size_t accepted = 0;
    for (const auto& rc : batch) {
        int r = rc.first;
        int c = rc.second;
        if (!topo.resolve(r, c)) continue;
        target.insert(topo.key(r, c));
        ++accepted;
    }
    return accepted;
}

/** @copydoc AutomatonEngine::nucleate */
void AutomatonEngine::nucleate(const CellBatch& batch, Population pop) {
    if (batch.empty()) return;
    if (pop == Population::Antimatter && !antiEnabled) return;
    addCells(batch, pop == Population::Matter ? live : antiLive);
    resolveOverlap(true);
    ++redraw;
}

/** @copydoc AutomatonEngine::seedPattern */
void AutomatonEngine::seedPattern(const CellBatch& batch, Population pop) {
    if (pop == Population::Antimatter && !antiEnabled) {
        Logger::debug("AutomatonEngine::seedPattern: antimatter disabled, ignoring " +
                      std::to_string(batch.size()) + " cells");
        return;
    }
    size_t accepted = addCells(batch, pop == Population::Matter ? live : antiLive);
    resolveOverlap(true);
    ++redraw;
    Logger::debug("AutomatonEngine::seedPattern: accepted " + std::to_string(accepted) + "/" +
                  std::to_string(batch.size()));
}

/** @copydoc AutomatonEngine::clear */
void AutomatonEngine::clear() {
    live.clear();
    antiLive.clear();
    gen = 0;
    ++redraw;
}

/** @copydoc AutomatonEngine::randomize */
void AutomatonEngine::randomize(double density, std::mt19937& rng) {
    double p = std::isfinite(density) ? std::max(0.0, std::min(1.0, density)) : 0.0;
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    LiveSet next;
    next.reserve(static_cast<size_t>(p * topo.cellCount()) + 16);
    const int total = topo.cellCount();
    for (int k = 0; k < total; ++k) {
        if (u01(rng) < p) next.insert(k);
    }
    live.swap(next);
    antiLive.clear();
    gen = 0;
    ++redraw;
    Logger::info("AutomatonEngine::randomize: density=" + std::to_string(p) +
                 " live=" + std::to_string(live.size()));
}

/** @copydoc AutomatonEngine::resize */
void AutomatonEngine::resize(int rows, int cols) {
    if (rows < 1) rows = 1;
    if (cols < 1) cols = 1;
    if (rows == topo.rows && cols == topo.cols) return;

    GridTopology next = topo;
    next.rows = rows;
    next.cols = cols;
    auto remap = [this, &next](const LiveSet& s) {
        LiveSet out;
        out.reserve(s.size());
        for (int k : s) {
            const int r = topo.rowOf(k);
            const int c = topo.colOf(k);
            if (next.inBounds(r, c)) out.insert(next.key(r, c));
        }
        return out;
    };
    const size_t before = live.size() + antiLive.size();
    LiveSet nextLive = remap(live);
    LiveSet nextAnti = remap(antiLive);
    live.swap(nextLive);
    antiLive.swap(nextAnti);

    // Pending events are keys too: re-key them under the new stride, drop the ones cut off.
    std::vector<int> nextEvents;
    nextEvents.reserve(events.size());
    for (int k : events) {
        const int r = topo.rowOf(k);
        const int c = topo.colOf(k);
        if (next.inBounds(r, c)) nextEvents.push_back(next.key(r, c));
    }
    events.swap(nextEvents);
    topo = next;
    resolveOverlap(true);
    ++redraw;
    Logger::info("AutomatonEngine::resize: " + std::to_string(rows) + "x" + std::to_string(cols) +
                 " dropped=" + std::to_string(before - live.size() - antiLive.size()));
}

/** @copydoc AutomatonEngine::setTopology */
void AutomatonEngine::setTopology(bool wrap) {
    if (topo.wrap == wrap) return;
    topo.wrap = wrap;
    ++redraw;
}

/** @copydoc AutomatonEngine::setAntimatterEnabled */
void AutomatonEngine::setAntimatterEnabled(bool on) {
    if (antiEnabled == on) return;
    antiEnabled = on;
    if (!on && !antiLive.empty()) {
        antiLive.clear();
        ++redraw;
    }
}

/** @copydoc AutomatonEngine::drainAnnihilations */
size_t AutomatonEngine::drainAnnihilations() {
    size_t n = events.size();
    events.clear();
    return n;
}

/** @copydoc AutomatonEngine::resolveOverlap */
void AutomatonEngine::resolveOverlap(bool emitEvents) {
    size_t removed = annihilateOverlap(live, antiLive, emitEvents ? &events : nullptr);
    if (removed > 0 && emitEvents) ++eventToken;
}
