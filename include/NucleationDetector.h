/**
 * @file NucleationDetector.h
 * @brief Declares NucleationDetector: finds threshold-crossing regions of the medium and turns them into cells.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "AutomatonEngine.h"

#include <cstdint>
#include <vector>

class CouplingAdapter;
class MediumField;

/** @brief Tunables for one scan; clamped by SimConfig before they get here. */
struct NucleationParams {
    float threshold{0.25f};     /**< tau: |blurred u| must exceed it to start a region */
    int cooldownTicks{8};       /**< scans a fired region stays blocked (including the firing scan) */
    int maxNucleiPerScan{4};    /**< cap on distinct nuclei per scan */
    int maxRadiusCells{8};      /**< cap on the disk radius, in automaton cells */
    bool antimatterEnabled{true}; /**< negative regions are ignored when false */
};

/** @brief One detected region and the nucleus derived from it. */
struct Nucleus {
    Population population{Population::Matter}; /**< Matter for positive crests, Antimatter for negative */
    int peakIndex{0};    /**< medium index of the most extreme cell */
    float peakValue{0};  /**< blurred value at the peak (signed) */
    int regionSize{0};   /**< number of medium cells in the region */
    int radius{0};       /**< derived radius; <=1 means a 2x2 block */
    int row{0};          /**< automaton row of the peak */
    int col{0};          /**< automaton column of the peak */
};

/** @brief Output of one scan: detected nuclei and the cell batches to seed, per population. */
struct NucleationResult {
    std::vector<Nucleus> nuclei;
    CellBatch matter;
    CellBatch antimatter;

    bool empty() const { return nuclei.empty(); }
};

/**
 * @class NucleationDetector
 * @brief Stateful scanner; its only state is the rotating scan offset and reusable work stacks.
 *
 * Each scan:
 * 1. ticks every positive cooldown counter down by one
 * 2. copies the current amplitude into scratch and blurs it twice (3x3 box)
 * 3. walks all cells starting at the rotating offset; every unvisited cooldown-free cell beyond
 *    +tau/-tau seeds a 4-connected same-sign flood fill (cooldown cells never join a region)
 * 4. for each region: sets cooldown on its cells and emits a 2x2 block or a disk at the peak
 */
class NucleationDetector {
public:
    /** @brief Offset advance per scan; a large odd stride keeps the start position from settling. */
    static constexpr int ScanStride = 9973;

    /** @brief Run one scan over @p field; cell batches are in automaton coordinates of @p coupling. */
    NucleationResult scan(MediumField& field, const CouplingAdapter& coupling, const NucleationParams& params);

    /** @brief Offset the next scan will start from (before reduction modulo the field size). */
    uint64_t scanOffset() const { return offset; }
    /** @brief Force the next start offset. */
    void setScanOffset(uint64_t off) { offset = off; }

    /** @brief Zero every cooldown counter of @p field. */
    static void clearCooldown(MediumField& field);

private:
    /** @brief Append the cells of a nucleus centred on (r,c) with @p radius to @p out. */
    static void emitShape(int r, int c, int radius, CellBatch& out);

    uint64_t offset{0};        /**< rotating start offset */
    std::vector<int> stack;    /**< flood-fill work stack */
    std::vector<int> region;   /**< current region members */
};
