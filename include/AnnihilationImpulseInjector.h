/**
 * @file AnnihilationImpulseInjector.h
 * @brief Declares AnnihilationImpulseInjector: turns annihilation events into net-zero medium impulses.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>

class AutomatonEngine;
class CouplingAdapter;
class MediumField;

/**
 * @class AnnihilationImpulseInjector
 * @brief Drains the engine's annihilation queue once per token and kicks the medium at each event.
 *
 * Each event adds +burst at its mapped medium cell and -burst/4 at the four direct neighbours,
 * written as +amount into the current amplitude and -amount into the previous one so the kick
 * also carries velocity. The total added is zero.
 */
class AnnihilationImpulseInjector {
public:
    /** @brief Events applied per drain; the remainder is dropped with the drain. */
    static constexpr size_t MaxEventsPerTick = 250;

    /**
     * @brief Apply and drain the pending events of @p engine, unless its token was already processed.
     * @param burst impulse magnitude in [0,1]
     * @return number of events applied
     */
    size_t apply(AutomatonEngine& engine, const CouplingAdapter& coupling, MediumField& field, float burst);

    /** @brief Token of the last drained batch. */
    uint64_t processedToken() const { return lastToken; }
    /** @brief Events applied since construction. */
    uint64_t appliedTotal() const { return applied; }
    /** @brief Events dropped by the per-tick cap since construction. */
    uint64_t droppedTotal() const { return dropped; }

private:
    uint64_t lastToken{0}; /**< annihilationToken() value already drained */
    uint64_t applied{0};   /**< running applied count */
    uint64_t dropped{0};   /**< running dropped count */
};
