/**
 * @file CouplingAdapter.h
 * @brief Declares CouplingAdapter: coordinate mapping between the automaton grid and the medium grid.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

class AutomatonEngine;
class MediumField;

/**
 * @class CouplingAdapter
 * @brief Nearest-cell mapping between an automaton of rows x cols and a medium of width x height,
 *        plus construction of the per-generation source map.
 */
class CouplingAdapter {
public:
    /** @brief Medium dimensions chosen for an automaton size. */
    struct MediumSize {
        int width{0};
        int height{0};
    };

    static constexpr int DownsampleFactor = 4;   /**< automaton cells per medium cell, per axis */
    static constexpr int MinMediumDim = 160;     /**< lower bound per medium axis */
    static constexpr int MaxMediumDim = 512;     /**< upper bound per medium axis */
    static constexpr float MatterSign = 1.0f;    /**< source sign of matter; antimatter contributes the opposite */

    /** @brief Downsampling rule: clamp(dim / DownsampleFactor, MinMediumDim, MaxMediumDim) per axis. */
    static MediumSize chooseResolution(int rows, int cols);

    CouplingAdapter(int rows, int cols, int mediumWidth, int mediumHeight);

    /** @brief Update both grid sizes after a resize or medium reallocation. */
    void configure(int rows, int cols, int mediumWidth, int mediumHeight);

    /** @brief Automaton (r,c) -> medium (x,y); floor(c*W/cols), floor(r*H/rows). */
    void toMedium(int r, int c, int& x, int& y) const;
    /** @brief Medium index for an automaton key row*cols+col. */
    int mediumIndexOfKey(int key) const;
    /** @brief Medium cell centre (x,y) -> automaton (r,c). */
    void toAutomaton(int x, int y, int& r, int& c) const;

    /** @brief Automaton cells covered by one medium cell; the source map is divided by it. */
    double cellAreaRatio() const;

    /**
     * @brief Rebuild the medium source map from the live sets.
     *
     * +1 per matter cell and -1 per antimatter cell (only when antimatter is enabled) accumulate
     * into the mapped medium cell, the map is scaled by 1/cellAreaRatio(), then blurred once
     * with a 3x3 box so that larger structures radiate broader wavefronts.
     */
    void rebuildSource(const AutomatonEngine& engine, MediumField& field) const;

    int rows() const { return autoRows; }
    int cols() const { return autoCols; }
    int mediumWidth() const { return medW; }
    int mediumHeight() const { return medH; }

private:
    int autoRows; /**< automaton rows */
    int autoCols; /**< automaton columns */
    int medW;     /**< medium width */
    int medH;     /**< medium height */
};
