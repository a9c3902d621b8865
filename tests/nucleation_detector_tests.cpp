/**
 * @file nucleation_detector_tests.cpp
 * @brief NucleationDetector: region detection, shapes, determinism, cooldown and caps.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CouplingAdapter.h"
#include "MediumField.h"
#include "NucleationDetector.h"

#include <cstdio>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

/** @brief Square plateau of @p v, @p half cells either side of (cx,cy). */
static void plateau(MediumField& f, int cx, int cy, int half, float v) {
    for (int y = cy - half; y <= cy + half; ++y)
        for (int x = cx - half; x <= cx + half; ++x)
            f.setAmplitude(x, y, v);
}

static NucleationParams params(int cooldown, int maxNuclei, bool anti) {
    NucleationParams p;
    p.threshold = 0.25f;
    p.cooldownTicks = cooldown;
    p.maxNucleiPerScan = maxNuclei;
    p.antimatterEnabled = anti;
    return p;
}

static int test_single_region_becomes_disk(void) {
    MediumField f(32, 32, true);
    CouplingAdapter a(32, 32, 32, 32);
    plateau(f, 10, 10, 3, 1.0f);
    NucleationDetector d;
    NucleationResult r = d.scan(f, a, params(8, 4, true));

    EXPECT(r.nuclei.size() == 1, "one region, one nucleus");
    const Nucleus& n = r.nuclei[0];
    EXPECT(n.population == Population::Matter, "positive crest is matter");
    EXPECT(n.peakValue > 0.99f, "peak of the smoothed plateau");
    EXPECT(n.row >= 9 && n.row <= 11 && n.col >= 9 && n.col <= 11, "peak mapped into the plateau core");
    EXPECT(n.radius == 7, "radius from 4*sqrt((peak-tau)/tau)");
    EXPECT(r.matter.size() > 100, "disk cells emitted");
    EXPECT(r.antimatter.empty(), "no antimatter");
    EXPECT(n.regionSize > 49, "region covers the smoothed plateau");
    return 0;
}

static int test_weak_region_becomes_block(void) {
    MediumField f(32, 32, false);
    CouplingAdapter a(32, 32, 32, 32);
    plateau(f, 16, 16, 3, 0.27f);
    NucleationDetector d;
    NucleationResult r = d.scan(f, a, params(8, 4, true));

    EXPECT(r.nuclei.size() == 1, "weak region still nucleates");
    const Nucleus& n = r.nuclei[0];
    EXPECT(n.radius <= 1, "small excess gives a small radius");
    EXPECT(r.matter.size() == 4, "2x2 block");
    EXPECT(r.matter[0] == CellCoord(n.row, n.col), "block anchored at the peak");
    EXPECT(r.matter[3] == CellCoord(n.row + 1, n.col + 1), "block extends down and right");
    return 0;
}

static int test_negative_region_and_antimatter_switch(void) {
    MediumField f(32, 32, true);
    CouplingAdapter a(32, 32, 32, 32);
    plateau(f, 20, 8, 3, -1.0f);

    NucleationDetector d;
    NucleationResult off = d.scan(f, a, params(8, 4, false));
    EXPECT(off.empty(), "negative regions ignored without antimatter");

    NucleationDetector::clearCooldown(f);
    NucleationResult on = d.scan(f, a, params(8, 4, true));
    EXPECT(on.nuclei.size() == 1, "negative region detected");
    EXPECT(on.nuclei[0].population == Population::Antimatter, "trough is antimatter");
    EXPECT(on.nuclei[0].peakValue < -0.99f, "signed peak");
    EXPECT(!on.antimatter.empty() && on.matter.empty(), "cells go to the antimatter batch");
    return 0;
}

static int test_adjacent_opposite_regions(void) {
    MediumField f(40, 40, true);
    CouplingAdapter a(40, 40, 40, 40);
    plateau(f, 10, 20, 4, 1.0f);
    plateau(f, 19, 20, 4, -1.0f);
    NucleationDetector d;
    NucleationResult r = d.scan(f, a, params(8, 4, true));
    int matter = 0, anti = 0;
    for (const auto& n : r.nuclei) (n.population == Population::Matter ? matter : anti)++;
    EXPECT(matter == 1 && anti == 1, "touching crest and trough are separate regions");
    return 0;
}

static int test_scan_is_deterministic(void) {
    MediumField f(48, 48, true);
    CouplingAdapter a(96, 96, 48, 48);
    plateau(f, 10, 10, 3, 1.0f);
    plateau(f, 30, 12, 2, 0.8f);
    plateau(f, 20, 35, 3, -0.6f);
    const std::vector<float> before = f.amplitude();

    NucleationDetector d;
    d.setScanOffset(1234);
    NucleationResult first = d.scan(f, a, params(8, 4, true));
    EXPECT(f.amplitude() == before, "scan leaves the amplitude alone");
    EXPECT(d.scanOffset() == (uint64_t)((1234 + NucleationDetector::ScanStride) % (48 * 48)), "offset advances by the stride");

    NucleationDetector::clearCooldown(f);
    d.setScanOffset(1234);
    NucleationResult second = d.scan(f, a, params(8, 4, true));
    EXPECT(first.nuclei.size() == 3, "three regions found");
    EXPECT(first.nuclei.size() == second.nuclei.size(), "same nucleus count");
    for (size_t i = 0; i < first.nuclei.size(); ++i) {
        EXPECT(first.nuclei[i].peakIndex == second.nuclei[i].peakIndex, "same peaks in the same order");
        EXPECT(first.nuclei[i].radius == second.nuclei[i].radius, "same radii");
    }
    EXPECT(first.matter == second.matter && first.antimatter == second.antimatter, "same cells");
    return 0;
}

static int test_cooldown_blocks_refiring(void) {
    MediumField f(32, 32, true);
    CouplingAdapter a(32, 32, 32, 32);
    plateau(f, 16, 16, 3, 1.0f);
    NucleationDetector d;
    const NucleationParams p = params(3, 4, true);

    EXPECT(d.scan(f, a, p).nuclei.size() == 1, "fires on the first scan");
    EXPECT(d.scan(f, a, p).empty(), "blocked on the next scan");
    EXPECT(d.scan(f, a, p).empty(), "still blocked");
    EXPECT(d.scan(f, a, p).nuclei.size() == 1, "fires again once the cooldown elapsed");
    return 0;
}

static int test_nuclei_cap(void) {
    MediumField f(64, 64, true);
    CouplingAdapter a(64, 64, 64, 64);
    plateau(f, 10, 10, 3, 1.0f);
    plateau(f, 40, 10, 3, 1.0f);
    plateau(f, 10, 40, 3, 1.0f);
    plateau(f, 40, 40, 3, 1.0f);
    NucleationDetector d;
    EXPECT(d.scan(f, a, params(8, 2, true)).nuclei.size() == 2, "capped at two");

    NucleationDetector::clearCooldown(f);
    EXPECT(d.scan(f, a, params(8, 0, true)).empty(), "cap of zero disables nucleation");
    EXPECT(d.scan(f, a, params(8, 64, true)).nuclei.size() == 4, "all regions under a large cap");
    return 0;
}

static int test_quiet_field_yields_nothing(void) {
    MediumField f(20, 20, false);
    CouplingAdapter a(20, 20, 20, 20);
    plateau(f, 5, 5, 1, 0.2f);
    NucleationDetector d;
    EXPECT(d.scan(f, a, params(8, 4, true)).empty(), "below threshold");
    return 0;
}

int main(void)
{
    if (test_single_region_becomes_disk() != 0) return 1;
    if (test_weak_region_becomes_block() != 0) return 1;
    if (test_negative_region_and_antimatter_switch() != 0) return 1;
    if (test_adjacent_opposite_regions() != 0) return 1;
    if (test_scan_is_deterministic() != 0) return 1;
    if (test_cooldown_blocks_refiring() != 0) return 1;
    if (test_nuclei_cap() != 0) return 1;
    if (test_quiet_field_yields_nothing() != 0) return 1;
    std::printf("nucleation_detector_tests: ok\n");
    return 0;
}
