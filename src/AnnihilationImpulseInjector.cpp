/**
 * @file AnnihilationImpulseInjector.cpp
 * @brief AnnihilationImpulseInjector implementation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AnnihilationImpulseInjector.h"
#include "AutomatonEngine.h"
#include "CouplingAdapter.h"
#include "Logger.h"
#include "MediumField.h"

#include <algorithm>
#include <cmath>
#include <string>

size_t AnnihilationImpulseInjector::apply(AutomatonEngine& engine, const CouplingAdapter& coupling,
                                          MediumField& field, float burst) {
    const uint64_t token = engine.annihilationToken();
    if (token == lastToken) return 0;
    lastToken = token;

    const std::vector<int>& events = engine.pendingAnnihilations();
    const size_t n = std::min(events.size(), MaxEventsPerTick);
    const float amount = std::isfinite(burst) ? std::max(0.0f, std::min(1.0f, burst)) : 0.0f;
    const float share = amount * 0.25f;
    const GridTopology& topo = field.topology();

    if (amount > 0.0f) {
        for (size_t e = 0; e < n; ++e) {
            int x = 0, y = 0;
            coupling.toMedium(events[e] / coupling.cols(), events[e] % coupling.cols(), x, y);
            field.addImpulse(topo.foldKey(y, x), amount);
            field.addImpulse(topo.foldKey(y, x - 1), -share);
            field.addImpulse(topo.foldKey(y, x + 1), -share);
            field.addImpulse(topo.foldKey(y - 1, x), -share);
            field.addImpulse(topo.foldKey(y + 1, x), -share);
        }
    }

    applied += n;
    dropped += events.size() - n;
    if (events.size() > n && Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("AnnihilationImpulseInjector: dropped " + std::to_string(events.size() - n) +
                      " events over the per-tick cap");
    }
    engine.drainAnnihilations();
    return n;
}
