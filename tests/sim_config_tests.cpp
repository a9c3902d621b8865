/**
 * @file sim_config_tests.cpp
 * @brief SimConfig: clamping, non-finite fallback, substep policy and env/argv overrides.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimConfig.h"

#include <cmath>
#include <cstdio>
#include <limits>
#include <stdlib.h>
#include <string>
#include <vector>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s\n", msg); \
        return 1; \
    } \
} while (0)

static int test_defaults_are_in_range(void) {
    SimConfig c;
    EXPECT(c.sanitize() == 0, "defaults need no clamping");
    EXPECT(c.rows == 1000 && c.cols == 1000, "default grid");
    EXPECT(c.mediumMode == MediumMode::Nucleation, "medium on by default");
    EXPECT(c.medium.noiseShape == BlobShape::Disk, "disk blobs by default");
    return 0;
}

static int test_clamping(void) {
    SimConfig c;
    c.rows = 3;
    c.cols = 5000;
    c.speedMs = 1;
    c.density = 2.0;
    c.medium.hopHz = 100.0f;
    c.medium.memoryRate = 0.9f;
    c.medium.noiseBlobSize = 0;
    c.generationTime = 5.0;
    c.mediumSubsteps = 99;
    c.nucleationThreshold = 0.0f;
    c.cooldownTicks = 0;
    c.maxNucleiPerScan = 1000;
    c.annihilationBurst = -1.0f;

    EXPECT(c.sanitize() == 13, "every out-of-range field counted");
    EXPECT(c.rows == 10 && c.cols == 1000, "grid clamped to [10,1000]");
    EXPECT(c.speedMs == 10, "speed clamped");
    EXPECT(c.density == 1.0, "density clamped");
    EXPECT(c.medium.hopHz == 20.0f, "hop frequency clamped");
    EXPECT(std::fabs(c.medium.memoryRate - 0.3f) < 1e-7f, "memory rate clamped");
    EXPECT(c.medium.noiseBlobSize == 1, "blob size clamped");
    EXPECT(c.generationTime == 0.2, "generation time clamped");
    EXPECT(c.mediumSubsteps == 16, "substeps clamped");
    EXPECT(std::fabs(c.nucleationThreshold - 0.01f) < 1e-7f, "threshold clamped");
    EXPECT(c.cooldownTicks == 1, "cooldown clamped");
    EXPECT(c.maxNucleiPerScan == 64, "nuclei cap clamped");
    EXPECT(c.annihilationBurst == 0.0f, "burst clamped");
    EXPECT(c.sanitize() == 0, "sanitize is idempotent");
    return 0;
}

static int test_non_finite_falls_back_to_default(void) {
    const SimConfig d;
    SimConfig c;
    c.medium.damping = std::numeric_limits<float>::quiet_NaN();
    c.medium.waveSpeedSq = std::numeric_limits<float>::infinity();
    c.generationTime = std::numeric_limits<double>::quiet_NaN();
    c.sanitize();
    EXPECT(c.medium.damping == d.medium.damping, "NaN damping uses default");
    EXPECT(c.medium.waveSpeedSq == d.medium.waveSpeedSq, "Inf wave speed uses default");
    EXPECT(c.generationTime == d.generationTime, "NaN generation time uses default");
    return 0;
}

static int test_effective_substeps(void) {
    SimConfig c;
    EXPECT(c.effectiveSubsteps() == 5, "0.08 per generation at 5 substeps is stable");
    c.generationTime = 0.2;
    EXPECT(c.effectiveSubsteps() == 12, "raised so no substep exceeds 1/60");
    c.mediumSubsteps = 16;
    EXPECT(c.effectiveSubsteps() == 16, "explicit larger count kept");
    return 0;
}

static int test_nucleation_params(void) {
    SimConfig c;
    c.nucleationThreshold = 0.5f;
    c.cooldownTicks = 12;
    c.maxNucleiPerScan = 3;
    c.antimatterEnabled = false;
    NucleationParams p = c.nucleationParams();
    EXPECT(p.threshold == 0.5f && p.cooldownTicks == 12 && p.maxNucleiPerScan == 3, "copied tunables");
    EXPECT(!p.antimatterEnabled, "antimatter switch follows the config");
    return 0;
}

static int test_arg_overrides(void) {
    SimConfig c;
    std::vector<std::string> args = {"matterwave", "--hop-hz=6", "--rows", "50", "--headless=3",
                                     "--blob-shape=square", "--density=abc", "--medium-mode=off",
                                     "--wrap=false", "--bogus", "plain"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);

    std::vector<std::string> rest = applyArgOverrides(c, (int)argv.size(), argv.data());
    EXPECT(c.medium.hopHz == 6.0f, "--name=value form");
    EXPECT(c.rows == 50, "--name value form");
    EXPECT(c.medium.noiseShape == BlobShape::Square, "enumerated value");
    EXPECT(c.density == SimConfig().density, "invalid value keeps the old one");
    EXPECT(c.mediumMode == MediumMode::Off, "medium mode parsed");
    EXPECT(!c.wrap, "boolean parsed");
    EXPECT(rest.size() == 3, "unknown arguments returned");
    EXPECT(rest[0] == "--headless=3" && rest[1] == "--bogus" && rest[2] == "plain", "in order");
    return 0;
}

static int test_env_overrides(void) {
    setenv("MATTERWAVE_HOP_STRENGTH", "2.5", 1);
    setenv("MATTERWAVE_MEDIUM_MODE", "off", 1);
    setenv("MATTERWAVE_MAX_NUCLEI", "not-a-number", 1);
    SimConfig c;
    applyEnvOverrides(c);
    unsetenv("MATTERWAVE_HOP_STRENGTH");
    unsetenv("MATTERWAVE_MEDIUM_MODE");
    unsetenv("MATTERWAVE_MAX_NUCLEI");
    EXPECT(c.medium.hopStrength == 2.5f, "env float");
    EXPECT(c.mediumMode == MediumMode::Off, "env enum");
    EXPECT(c.maxNucleiPerScan == 4, "bad env value ignored");
    return 0;
}

static int test_applied_options_recorded(void) {
    SimConfig c;
    std::vector<std::string> args = {"matterwave", "--rows=1000", "--cols", "oops", "--seed=3"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    AppliedOptions given;
    applyArgOverrides(c, (int)argv.size(), argv.data(), &given);
    EXPECT(given.count("rows") == 1, "value equal to the default still counts as given");
    EXPECT(given.count("cols") == 0, "rejected value is not recorded");
    EXPECT(given.count("seed") == 1 && c.seed == 3, "other options recorded");

    setenv("MATTERWAVE_COLS", "120", 1);
    AppliedOptions fromEnv;
    applyEnvOverrides(c, &fromEnv);
    unsetenv("MATTERWAVE_COLS");
    EXPECT(fromEnv.count("cols") == 1 && c.cols == 120, "environment values recorded");
    EXPECT(fromEnv.count("rows") == 0, "untouched options absent");
    return 0;
}

static int test_option_names(void) {
    std::vector<std::string> names = configOptionNames();
    bool hop = false, seed = false;
    for (const auto& n : names) {
        if (n == "hop-hz") hop = true;
        if (n == "seed") seed = true;
    }
    EXPECT(hop && seed, "options listed for help output");
    return 0;
}

int main(void)
{
    if (test_defaults_are_in_range() != 0) return 1;
    if (test_clamping() != 0) return 1;
    if (test_non_finite_falls_back_to_default() != 0) return 1;
    if (test_effective_substeps() != 0) return 1;
    if (test_nucleation_params() != 0) return 1;
    if (test_arg_overrides() != 0) return 1;
    if (test_env_overrides() != 0) return 1;
    if (test_applied_options_recorded() != 0) return 1;
    if (test_option_names() != 0) return 1;
    std::printf("sim_config_tests: ok\n");
    return 0;
}
