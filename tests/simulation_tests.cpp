/**
 * @file simulation_tests.cpp
 * @brief Simulation: full pipeline invariants, medium modes, event accounting and snapshots.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

static SimConfig smallConfig(uint32_t seed) {
    SimConfig c;
    c.rows = 40;
    c.cols = 40;
    c.seed = seed;
    return c;
}

static bool disjoint(const Snapshot& s) {
    for (int k : s.matter)
        if (std::binary_search(s.antimatter.begin(), s.antimatter.end(), k)) return false;
    return true;
}

static int test_construction(void) {
    Simulation sim(smallConfig(1));
    auto s = sim.snapshot();
    EXPECT(s != nullptr, "snapshot published on construction");
    EXPECT(s->matter.empty() && s->antimatter.empty(), "starts empty");
    EXPECT(s->mediumWidth == 160 && s->mediumHeight == 160, "medium floor of 160");
    EXPECT((int)s->amplitude.size() == 160 * 160, "amplitude copied");
    EXPECT(s->generation == 0, "generation zero");
    return 0;
}

static int test_pipeline_invariants(void) {
    Simulation sim(smallConfig(5));
    sim.randomize(0.3);
    sim.seedPattern({{3, 3}, {3, 4}, {4, 3}, {4, 4}, {20, 20}, {20, 21}, {21, 20}}, Population::Antimatter);
    uint64_t lastSeq = sim.snapshot()->seq;
    for (int g = 1; g <= 25; ++g) {
        sim.step();
        auto s = sim.snapshot();
        EXPECT(disjoint(*s), "populations never overlap");
        EXPECT(s->matter.size() <= 1600 && s->antimatter.size() <= 1600, "counts bounded");
        EXPECT(s->pendingAnnihilations == 0, "events drained every generation");
        EXPECT(s->generation == (uint64_t)g, "generation advances by one");
        EXPECT(s->seq > lastSeq, "new snapshot per operation");
        EXPECT(std::is_sorted(s->matter.begin(), s->matter.end()), "matter keys sorted");
        EXPECT(std::isfinite(s->mediumEnergy), "energy finite");
        lastSeq = s->seq;
    }
    return 0;
}

static int test_events_consumed_in_nucleation_mode(void) {
    Simulation sim(smallConfig(9));
    sim.seedPattern({{10, 10}, {10, 11}, {11, 10}, {11, 11}}, Population::Matter);
    sim.seedPattern({{10, 10}, {10, 11}, {11, 10}, {11, 11}}, Population::Antimatter);
    EXPECT(sim.snapshot()->pendingAnnihilations == 4, "seeding overlap records events");
    sim.step();
    auto s = sim.snapshot();
    EXPECT(s->consumedAnnihilations >= 4, "events reached the medium");
    EXPECT(s->pendingAnnihilations == 0, "queue empty after the step");
    EXPECT(s->mediumEnergy > 0.0, "medium excited");
    return 0;
}

static int test_medium_off_discards_events(void) {
    SimConfig c = smallConfig(3);
    c.mediumMode = MediumMode::Off;
    Simulation sim(c);
    sim.seedPattern({{10, 10}, {10, 11}, {11, 10}, {11, 11}}, Population::Matter);
    sim.seedPattern({{10, 10}, {10, 11}, {11, 10}, {11, 11}}, Population::Antimatter);
    sim.step();
    auto s = sim.snapshot();
    EXPECT(s->pendingAnnihilations == 0, "events discarded");
    EXPECT(s->droppedAnnihilations == 4, "discarded events counted");
    EXPECT(s->consumedAnnihilations == 0, "nothing injected");
    EXPECT(s->mediumEnergy == 0.0, "medium untouched");
    EXPECT(s->lastNuclei == 0, "no nucleation");
    return 0;
}

static int test_clear_and_paint(void) {
    Simulation sim(smallConfig(4));
    sim.seedPattern({{5, 5}}, Population::Matter);
    sim.seedPattern({{5, 5}, {6, 6}}, Population::Antimatter);
    EXPECT(sim.snapshot()->pendingAnnihilations == 1, "one event from seeding");

    sim.paintCell(6, 6, PaintMode::Add);
    auto s = sim.snapshot();
    EXPECT(s->antimatter.empty() && s->matter.empty(), "paint annihilates");
    EXPECT(s->pendingAnnihilations == 1, "paint adds no event");

    sim.step();
    sim.clear();
    s = sim.snapshot();
    EXPECT(s->generation == 0, "clear resets generation");
    EXPECT(s->pendingAnnihilations == 0, "clear discards events");
    return 0;
}

static int test_resize_and_topology(void) {
    Simulation sim(smallConfig(6));
    sim.seedPattern({{2, 2}, {30, 35}}, Population::Matter);
    sim.resize(20, 30);
    auto s = sim.snapshot();
    EXPECT(s->topology.rows == 20 && s->topology.cols == 30, "resized");
    EXPECT(s->matter.size() == 1 && s->matter[0] == 2 * 30 + 2, "out of bounds cell dropped");
    EXPECT(s->mediumWidth == 160 && s->mediumHeight == 160, "medium size from the rule");

    sim.resize(5, 2000);
    EXPECT(sim.config().rows == 10 && sim.config().cols == 1000, "resize clamped");
    EXPECT(sim.snapshot()->mediumWidth == 250, "medium reallocated for the wider grid");

    sim.setTopology(false);
    EXPECT(!sim.snapshot()->topology.wrap, "bounded");
    EXPECT(!sim.mediumField().topology().wrap, "medium follows");
    return 0;
}

static int test_parameter_setters(void) {
    Simulation sim(smallConfig(8));
    MediumParams p = sim.config().medium;
    p.damping = std::numeric_limits<float>::quiet_NaN();
    p.hopHz = 50.0f;
    sim.setMediumParams(p);
    EXPECT(sim.config().medium.damping == SimConfig().medium.damping, "NaN parameter falls back");
    EXPECT(sim.config().medium.hopHz == 20.0f, "parameter clamped");

    p = sim.config().medium;
    p.noiseEnabled = false;
    p.noiseIntensity = 0.0f;
    sim.setMediumParams(p);
    sim.setMediumMode(MediumMode::Off);
    sim.setMediumMode(MediumMode::Nucleation);
    EXPECT(sim.config().medium.noiseEnabled, "nucleation mode turns noise on");
    EXPECT(sim.config().medium.noiseIntensity > 0.0f, "with a usable intensity");

    sim.seedPattern({{1, 1}}, Population::Antimatter);
    sim.setAntimatterEnabled(false);
    EXPECT(sim.snapshot()->antimatter.empty(), "disabling antimatter clears it");
    EXPECT(!sim.config().nucleationParams().antimatterEnabled, "scan skips negative regions");
    return 0;
}

static int test_patterns_through_simulation(void) {
    Simulation sim(smallConfig(2));
    sim.centerPattern(findPattern("blinker")->lines, Population::Matter);
    auto s = sim.snapshot();
    EXPECT(s->matter.size() == 3, "blinker seeded");
    EXPECT(s->matter[0] == 19 * 40 + 18, "centred with floor");
    sim.placePattern(findPattern("block")->lines, 0, 0, Population::Antimatter);
    EXPECT(sim.snapshot()->antimatter.size() == 4, "block placed");
    return 0;
}

static int test_source_survives_generation_reset(void) {
    SimConfig c = smallConfig(11);
    c.medium.hopHz = 20.0f;
    c.medium.hopStrength = 3.0f;
    c.medium.noiseEnabled = false;
    Simulation sim(c);
    sim.seedPattern({{8, 8}, {8, 9}, {9, 8}, {9, 9}}, Population::Matter);
    for (int i = 0; i < 5; ++i) sim.step();

    // clear() sends the generation back to 0: the medium resets on the next step.
    sim.clear();
    sim.seedPattern({{20, 20}, {20, 21}, {21, 20}, {21, 21}}, Population::Matter);
    sim.step();

    double total = 0.0;
    for (float v : sim.mediumField().source()) total += std::fabs(v);
    EXPECT(total > 0.0, "source map rebuilt after the reset");
    EXPECT(sim.mediumField().hopCount() >= 1, "hop fired this generation");
    EXPECT(sim.snapshot()->mediumEnergy > 0.0, "hop reached the medium");
    return 0;
}

static int test_seeded_runs_repeat(void) {
    Simulation a(smallConfig(42)), b(smallConfig(42));
    a.randomize(0.25);
    b.randomize(0.25);
    for (int i = 0; i < 8; ++i) {
        a.step();
        b.step();
    }
    EXPECT(a.snapshot()->matter == b.snapshot()->matter, "same matter");
    EXPECT(a.snapshot()->antimatter == b.snapshot()->antimatter, "same antimatter");
    EXPECT(a.snapshot()->amplitude == b.snapshot()->amplitude, "same medium");
    return 0;
}

int main(void)
{
    if (test_construction() != 0) return 1;
    if (test_pipeline_invariants() != 0) return 1;
    if (test_events_consumed_in_nucleation_mode() != 0) return 1;
    if (test_medium_off_discards_events() != 0) return 1;
    if (test_clear_and_paint() != 0) return 1;
    if (test_resize_and_topology() != 0) return 1;
    if (test_parameter_setters() != 0) return 1;
    if (test_patterns_through_simulation() != 0) return 1;
    if (test_source_survives_generation_reset() != 0) return 1;
    if (test_seeded_runs_repeat() != 0) return 1;
    std::printf("simulation_tests: ok\n");
    return 0;
}
