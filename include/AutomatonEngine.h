/**
 * @file AutomatonEngine.h
 * @brief Declares AutomatonEngine: two sparse life populations (matter, antimatter) with mutual annihilation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "GridTopology.h"

#include <cstdint>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

/** @brief The two automaton species. Both follow the same B3/S23 rule on their own set. */
enum class Population { Matter, Antimatter };

/** @brief Manual drawing mode for paintCell(). */
enum class PaintMode { Add, Erase };

using LiveSet = std::unordered_set<int>;        /**< set of flattened keys row*cols+col */
using CellCoord = std::pair<int, int>;          /**< (row, col) */
using CellBatch = std::vector<CellCoord>;       /**< list of coordinates, possibly out of range */

/**
 * @class AutomatonEngine
 * @brief Owns the matter and antimatter live sets and advances them one generation at a time.
 *
 * Responsibilities:
 * - Classic life stepping for each population independently (8-neighbourhood, topology aware)
 * - Mutual annihilation of coincident matter/antimatter keys after every mutation
 * - Recording annihilation events for the medium, except for manual painting
 * - Generation and redraw counters
 *
 * Invariant: after any public method returns, no key is a member of both sets.
 * Out-of-range input is dropped (bounded) or wrapped (toroidal); nothing throws.
 */
class AutomatonEngine {
public:
    /** @brief Construct an empty engine over @p topo (rows/cols must be positive). */
    explicit AutomatonEngine(const GridTopology& topo);

    // Stepping
    /** @brief Advance both populations by one generation; annihilation emits events. */
    void step();

    // Mutations
    /** @brief Add or erase one in-bounds matter cell; annihilation is silent. */
    void paintCell(int r, int c, PaintMode mode);
    /** @brief Bulk-add cells to @p pop (ignored for antimatter while disabled); annihilation emits events. */
    void nucleate(const CellBatch& cells, Population pop);
    /** @brief Seed a pattern's cells into @p pop; same resolution and event rules as nucleate(). */
    void seedPattern(const CellBatch& cells, Population pop);
    /** @brief Remove every cell of both populations and reset the generation counter. */
    void clear();
    /** @brief Replace matter by a Bernoulli(@p density) sample, clear antimatter, reset the generation counter. */
    void randomize(double density, std::mt19937& rng);
    /** @brief Change dimensions; cells outside the new bounds are discarded. */
    void resize(int rows, int cols);
    /** @brief Switch between toroidal (@p wrap true) and bounded addressing. */
    void setTopology(bool wrap);
    /** @brief Enable/disable the antimatter population; disabling clears it. */
    void setAntimatterEnabled(bool on);

    // Accessors
    const GridTopology& topology() const { return topo; }
    const LiveSet& matter() const { return live; }
    const LiveSet& antimatter() const { return antiLive; }
    const LiveSet& cells(Population pop) const { return pop == Population::Matter ? live : antiLive; }
    size_t matterCount() const { return live.size(); }
    size_t antimatterCount() const { return antiLive.size(); }
    bool antimatterEnabled() const { return antiEnabled; }
    bool isAlive(int r, int c, Population pop) const;

    /** @brief Number of completed step() calls since construction, clear() or randomize(). */
    uint64_t generation() const { return gen; }
    /** @brief Bumped whenever visible state changed; renderers compare it to skip redundant draws. */
    uint64_t redrawToken() const { return redraw; }

    // Annihilation event queue (consumed by the impulse injector)
    /** @brief Keys annihilated since the last drain, in the order they were resolved. */
    const std::vector<int>& pendingAnnihilations() const { return events; }
    /** @brief Bumped each time new events are appended; the injector uses it as its processed guard. */
    uint64_t annihilationToken() const { return eventToken; }
    /** @brief Drop all pending events; returns how many were dropped. */
    size_t drainAnnihilations();

    /**
     * @brief Remove keys present in both @p a and @p b, iterating the smaller set.
     * @param out when non-null, each removed key is appended to it
     * @return number of keys removed from each set
     */
    static size_t annihilateOverlap(LiveSet& a, LiveSet& b, std::vector<int>* out);

private:
    /** @brief One B3/S23 generation of @p current under the engine topology. */
    LiveSet stepPopulation(const LiveSet& current) const;
    /** @brief Resolve and insert @p cells into @p target; returns how many coordinates were accepted. */
    size_t addCells(const CellBatch& cells, LiveSet& target) const;
    /** @brief Run the overlap pass on the live sets, optionally recording events. */
    void resolveOverlap(bool emitEvents);

    GridTopology topo;          /**< current addressing rules */
    LiveSet live;               /**< matter keys */
    LiveSet antiLive;           /**< antimatter keys */
    bool antiEnabled{true};     /**< antimatter population enabled */
    uint64_t gen{0};            /**< generation counter */
    uint64_t redraw{0};         /**< redraw token */
    std::vector<int> events;    /**< pending annihilation keys */
    uint64_t eventToken{0};     /**< bumped whenever events grow */
};
