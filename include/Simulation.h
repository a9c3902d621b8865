/**
 * @file Simulation.h
 * @brief Declares Simulation: owns the automaton, the medium and the coupling pipeline between them.
 *
 * The Simulation is the only object a driver talks to. Every public method is a complete, synchronous
 * operation; callers serialize them (there is no internal locking). After each one a fresh immutable
 * Snapshot is published for passive readers such as the terminal view.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "AnnihilationImpulseInjector.h"
#include "AutomatonEngine.h"
#include "CouplingAdapter.h"
#include "MediumField.h"
#include "NucleationDetector.h"
#include "Patterns.h"
#include "SimConfig.h"

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

/**
 * @struct Snapshot
 * @brief Read-only copy of everything a renderer or test needs after an operation.
 */
struct Snapshot {
    GridTopology topology;            /**< automaton rows/cols/wrap */
    std::vector<int> matter;          /**< sorted matter keys */
    std::vector<int> antimatter;      /**< sorted antimatter keys */
    int mediumWidth{0};
    int mediumHeight{0};
    std::vector<float> amplitude;     /**< medium curr buffer, row-major */
    uint64_t generation{0};
    uint64_t redrawToken{0};
    size_t pendingAnnihilations{0};   /**< events recorded but not yet injected */
    uint64_t consumedAnnihilations{0};/**< events injected into the medium so far */
    uint64_t droppedAnnihilations{0}; /**< events discarded (per-tick cap or medium off) */
    size_t lastNuclei{0};             /**< nuclei created by the most recent scan */
    uint64_t totalNuclei{0};          /**< nuclei created since construction */
    double mediumEnergy{0.0};         /**< sum of u^2 */
    double mediumMean{0.0};           /**< sampled mean amplitude */
    MediumMode mediumMode{MediumMode::Nucleation};
    bool antimatterEnabled{true};
    uint64_t seq{0};                  /**< publication sequence number */
};

/**
 * @class Simulation
 * @brief Coupled automaton/medium world.
 *
 * One generation (step()):
 * 1. AutomatonEngine::step (annihilation events recorded)
 * 2. CouplingAdapter::rebuildSource
 * 3. MediumField::syncGeneration + integrate (fixed medium time per generation)
 * 4. NucleationDetector::scan, then AutomatonEngine::nucleate per population
 * 5. AnnihilationImpulseInjector::apply (drains the event queue once)
 *
 * Steps 2 to 5 are skipped when the medium is off; pending events are then discarded.
 */
class Simulation {
public:
    /** @brief Build a world from @p config (sanitized first). Both live sets start empty. */
    explicit Simulation(const SimConfig& config);

    // Core operations
    /** @brief Advance one generation through the full pipeline. */
    void step();
    /** @brief Manually add/erase a matter cell; never produces a medium impulse. */
    void paintCell(int r, int c, PaintMode mode);
    /** @brief Remove all cells, reset the generation counter and discard pending events. */
    void clear();
    /** @brief Randomize matter with the configured density. */
    void randomize();
    /** @brief Store @p density (clamped) in the configuration and randomize with it. */
    void randomize(double density);
    /** @brief Add arbitrary coordinates to @p pop (wrapped or dropped per topology). */
    void seedPattern(const CellBatch& cells, Population pop);
    /** @brief Seed '#'-art with its top-left corner at (top,left). */
    void placePattern(const PatternLines& lines, int top, int left, Population pop);
    /** @brief Seed '#'-art centred on the grid. */
    void centerPattern(const PatternLines& lines, Population pop);
    /** @brief Resize the automaton (clamped to [10,1000] per axis); reallocates the medium if its size changes. */
    void resize(int rows, int cols);
    /** @brief Toroidal (true) or bounded (false) addressing for both grids. */
    void setTopology(bool wrap);
    /** @brief Replace the medium parameters (clamped). */
    void setMediumParams(const MediumParams& params);
    /** @brief Replace the whole configuration (clamped); applies resize/topology/population changes. */
    void setConfig(const SimConfig& config);
    /** @brief Turn the medium off or on; switching to nucleation makes sure ambient noise is on. */
    void setMediumMode(MediumMode mode);
    /** @brief Enable/disable the antimatter population; disabling clears it. */
    void setAntimatterEnabled(bool on);

    // Read access
    /** @brief Most recently published snapshot (never null). */
    std::shared_ptr<const Snapshot> snapshot() const { return snap; }
    const SimConfig& config() const { return cfg; }
    const AutomatonEngine& automatonEngine() const { return automaton; }
    const MediumField& mediumField() const { return field; }
    const CouplingAdapter& couplingAdapter() const { return coupling; }
    /** @brief Result of the most recent nucleation scan. */
    const NucleationResult& lastNucleation() const { return lastScan; }

private:
    /** @brief Reallocate the medium when the automaton size maps to a new medium size. */
    void syncMediumSize();
    /** @brief Discard pending events without touching the medium. */
    void discardAnnihilations();
    /** @brief Build and publish a new Snapshot. */
    void publish();

    SimConfig cfg;                        /**< sanitized configuration */
    std::mt19937 prng;                    /**< randomize() and ambient noise */
    AutomatonEngine automaton;            /**< matter / antimatter sets */
    MediumField field;                    /**< wave medium */
    CouplingAdapter coupling;             /**< grid mapping */
    NucleationDetector detector;          /**< medium -> cells */
    AnnihilationImpulseInjector injector; /**< cells -> medium */
    NucleationResult lastScan;            /**< last scan output */
    uint64_t totalNuclei{0};
    uint64_t discarded{0};                /**< events dropped while the medium was off or on clear() */
    uint64_t snapSeq{0};
    std::shared_ptr<const Snapshot> snap;
};
