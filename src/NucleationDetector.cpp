/**
 * @file NucleationDetector.cpp
 * @brief NucleationDetector implementation: smoothed threshold scan with stack-based flood fill.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "NucleationDetector.h"
#include "CouplingAdapter.h"
#include "Logger.h"
#include "MediumField.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace {
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

void NucleationDetector::clearCooldown(MediumField& field) {
    std::vector<uint16_t>& cool = field.cooldown();
    std::fill(cool.begin(), cool.end(), (uint16_t)0);
}

void NucleationDetector::emitShape(int r, int c, int radius, CellBatch& out) {
    if (radius <= 1) {
        // Still life: positive offsets only so a wrap never splits the block.
        out.emplace_back(r, c);
        out.emplace_back(r, c + 1);
        out.emplace_back(r + 1, c);
        out.emplace_back(r + 1, c + 1);
        return;
    }
    for (int dr = -radius; dr <= radius; ++dr) {
        for (int dc = -radius; dc <= radius; ++dc) {
            if (dr * dr + dc * dc > radius * radius) continue;
            out.emplace_back(r + dr, c + dc);
        }
    }
}

NucleationResult NucleationDetector::scan(MediumField& field, const CouplingAdapter& coupling,
                                          const NucleationParams& params) {
    NucleationResult result;
    const int len = field.size();
    if (len <= 0) return result;

    std::vector<uint16_t>& cool = field.cooldown();
    for (auto& c : cool) if (c > 0) --c;

    const GridTopology& topo = field.topology();
    const int w = topo.cols;
    const float tau = params.threshold;
    const uint16_t cooldownTicks = (uint16_t)clampi(params.cooldownTicks, 1, 65535);

    // Signed drive: blurring u itself keeps negative crests and turns rings into central bumps.
    std::vector<float>& drive = field.scratchA();
    std::vector<float>& tmp = field.scratchB();
    drive = field.amplitude();
    MediumField::boxBlur3x3(topo, drive, tmp);
    MediumField::boxBlur3x3(topo, tmp, drive);

    std::vector<uint8_t>& seen = field.visited();
    std::fill(seen.begin(), seen.end(), (uint8_t)0);

    const int start = (int)(offset % (uint64_t)len);
    offset = (uint64_t)((start + ScanStride) % len);

    for (int n = 0; n < len; ++n) {
        if ((int)result.nuclei.size() >= params.maxNucleiPerScan) break;
        const int i = (start + n) % len;
        if (seen[(size_t)i] || cool[(size_t)i] > 0) continue;

        const float v0 = drive[(size_t)i];
        int sign = 0;
        if (v0 > tau) sign = 1;
        else if (v0 < -tau) sign = -1;
        else continue;
        if (sign < 0 && !params.antimatterEnabled) continue;

        region.clear();
        stack.clear();
        stack.push_back(i);
        int peakIdx = i;
        float peakValue = v0;

        while (!stack.empty()) {
            const int j = stack.back();
            stack.pop_back();
            if (seen[(size_t)j] || cool[(size_t)j] > 0) continue;
            const float v = drive[(size_t)j];
            if (sign > 0 ? !(v >= tau) : !(v <= -tau)) continue;
            seen[(size_t)j] = 1;
            region.push_back(j);
            if ((sign > 0 && v > peakValue) || (sign < 0 && v < peakValue)) {
                peakValue = v;
                peakIdx = j;
            }
            const int y = j / w;
            const int x = j % w;
            stack.push_back(topo.foldKey(y, x - 1));
            stack.push_back(topo.foldKey(y, x + 1));
            stack.push_back(topo.foldKey(y - 1, x));
            stack.push_back(topo.foldKey(y + 1, x));
        }

        if (region.empty()) continue;
        for (int j : region) cool[(size_t)j] = cooldownTicks;

        Nucleus nu;
        nu.population = sign > 0 ? Population::Matter : Population::Antimatter;
        nu.peakIndex = peakIdx;
        nu.peakValue = peakValue;
        nu.regionSize = (int)region.size();
        coupling.toAutomaton(peakIdx % w, peakIdx / w, nu.row, nu.col);

        const float over = std::max(0.0f, std::fabs(peakValue) - tau);
        const float rel = over / std::max(1e-6f, tau);
        nu.radius = clampi((int)std::lround(std::sqrt(rel) * 4.0f), 0, params.maxRadiusCells);

        emitShape(nu.row, nu.col, nu.radius, sign > 0 ? result.matter : result.antimatter);
        result.nuclei.push_back(nu);
    }

    if (!result.nuclei.empty() && Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("NucleationDetector::scan: nuclei=" + std::to_string(result.nuclei.size()) +
                      " matterCells=" + std::to_string(result.matter.size()) +
                      " antimatterCells=" + std::to_string(result.antimatter.size()));
    }
    return result;
}
