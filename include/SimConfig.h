/**
 * @file SimConfig.h
 * @brief Declares SimConfig: the explicit, sanitized configuration owned by the Simulation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "MediumField.h"
#include "NucleationDetector.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

/** @brief Whether the medium runs at all. */
enum class MediumMode { Off, Nucleation };

/**
 * @struct SimConfig
 * @brief Every tunable of the simulation in one value type.
 *
 * The Simulation holds one copy and replaces it only through its setters, between steps.
 * sanitize() is the single place where ranges are enforced; non-finite numbers fall back to
 * the defaults below.
 */
struct SimConfig {
    // Automaton
    int rows{1000};              /**< [10,1000] */
    int cols{1000};              /**< [10,1000] */
    bool wrap{true};             /**< toroidal topology */
    int speedMs{80};             /**< driver step interval, [10,400] */
    double density{0.02};        /**< randomize() fill probability, [0,1] */
    bool antimatterEnabled{true};

    // Medium
    MediumMode mediumMode{MediumMode::Nucleation};
    MediumParams medium;         /**< wave, memory, hop and noise parameters */
    double generationTime{0.08}; /**< medium time integrated per generation, [0.005,0.2] */
    int mediumSubsteps{5};       /**< requested substeps per generation, [1,16] */

    // Coupling
    float nucleationThreshold{0.25f}; /**< [0.01,2] */
    int cooldownTicks{8};             /**< [1,600] */
    int maxNucleiPerScan{4};          /**< [0,64] */
    float annihilationBurst{0.25f};   /**< [0,1] */

    uint32_t seed{0};            /**< PRNG seed; 0 draws one from std::random_device */

    /** @brief Largest substep the explicit scheme is run with. */
    static constexpr double MaxSubstepDt = 1.0 / 60.0;

    /** @brief Clamp every field to its documented range; returns the number of fields changed. */
    int sanitize();
    /** @brief Substeps actually used: mediumSubsteps raised so no substep exceeds MaxSubstepDt. */
    int effectiveSubsteps() const;
    /** @brief Nucleation tunables derived from this configuration. */
    NucleationParams nucleationParams() const;
    /** @brief One-line human readable summary for the log. */
    std::string summary() const;
};

/** @brief Names of the options an override actually set (valid values only). */
using AppliedOptions = std::set<std::string>;

/**
 * @brief Apply MATTERWAVE_<NAME> environment overrides (e.g. MATTERWAVE_HOP_HZ=6).
 * @param applied when non-null, receives the option name of every accepted value
 */
void applyEnvOverrides(SimConfig& cfg, AppliedOptions* applied = nullptr);

/**
 * @brief Apply --name=value / --name value command line overrides.
 * @param applied when non-null, receives the option name of every accepted value
 * @return arguments that are not configuration options, in order (left for the caller)
 */
std::vector<std::string> applyArgOverrides(SimConfig& cfg, int argc, char** argv,
                                           AppliedOptions* applied = nullptr);

/** @brief Names accepted by the override functions, for --help output. */
std::vector<std::string> configOptionNames();
