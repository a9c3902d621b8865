/**
 * @file SimConfig.cpp
 * @brief SimConfig implementation: range clamping and environment / command line overrides.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SimConfig.h"
#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <sstream>

namespace {
static bool parseFloat(const char* s, float& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    out = static_cast<float>(v);
    return true;
}

static bool parseDouble(const char* s, double& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    out = v;
    return true;
}

static bool parseInt(const char* s, int& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || errno != 0 || v < -1000000000L || v > 1000000000L) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parseBool(const char* s, bool& out) {
    if (!s) return false;
    std::string v(s);
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "1" || v == "true" || v == "on" || v == "yes") { out = true; return true; }
    if (v == "0" || v == "false" || v == "off" || v == "no") { out = false; return true; }
    return false;
}

/** @brief One configurable option: its CLI name and a parser writing into the config. */
struct Option {
    const char* name;
    std::function<bool(SimConfig&, const char*)> set;
};

static const std::vector<Option>& options() {
    static const std::vector<Option> table = {
        {"rows",            [](SimConfig& c, const char* v) { return parseInt(v, c.rows); }},
        {"cols",            [](SimConfig& c, const char* v) { return parseInt(v, c.cols); }},
        {"wrap",            [](SimConfig& c, const char* v) { return parseBool(v, c.wrap); }},
        {"speed-ms",        [](SimConfig& c, const char* v) { return parseInt(v, c.speedMs); }},
        {"density",         [](SimConfig& c, const char* v) { return parseDouble(v, c.density); }},
        {"antimatter",      [](SimConfig& c, const char* v) { return parseBool(v, c.antimatterEnabled); }},
        {"medium-mode",     [](SimConfig& c, const char* v) {
            if (!v) return false;
            if (std::strcmp(v, "off") == 0) { c.mediumMode = MediumMode::Off; return true; }
            if (std::strcmp(v, "nucleation") == 0) { c.mediumMode = MediumMode::Nucleation; return true; }
            return false; }},
        {"hop-hz",          [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.hopHz); }},
        {"hop-strength",    [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.hopStrength); }},
        {"threshold",       [](SimConfig& c, const char* v) { return parseFloat(v, c.nucleationThreshold); }},
        {"memory-rate",     [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.memoryRate); }},
        {"memory-coupling", [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.memoryCoupling); }},
        {"nonlinearity",    [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.nonlinearity); }},
        {"burst",           [](SimConfig& c, const char* v) { return parseFloat(v, c.annihilationBurst); }},
        {"noise",           [](SimConfig& c, const char* v) { return parseBool(v, c.medium.noiseEnabled); }},
        {"noise-intensity", [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.noiseIntensity); }},
        {"blob-size",       [](SimConfig& c, const char* v) { return parseInt(v, c.medium.noiseBlobSize); }},
        {"blob-shape",      [](SimConfig& c, const char* v) {
            if (!v) return false;
            if (std::strcmp(v, "square") == 0) { c.medium.noiseShape = BlobShape::Square; return true; }
            if (std::strcmp(v, "disk") == 0 || std::strcmp(v, "circle") == 0) { c.medium.noiseShape = BlobShape::Disk; return true; }
            return false; }},
        {"wave-speed-sq",   [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.waveSpeedSq); }},
        {"damping",         [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.damping); }},
        {"dispersion",      [](SimConfig& c, const char* v) { return parseFloat(v, c.medium.dispersion); }},
        {"generation-time", [](SimConfig& c, const char* v) { return parseDouble(v, c.generationTime); }},
        {"substeps",        [](SimConfig& c, const char* v) { return parseInt(v, c.mediumSubsteps); }},
        {"cooldown",        [](SimConfig& c, const char* v) { return parseInt(v, c.cooldownTicks); }},
        {"max-nuclei",      [](SimConfig& c, const char* v) { return parseInt(v, c.maxNucleiPerScan); }},
        {"seed",            [](SimConfig& c, const char* v) {
            int s = 0;
            if (!parseInt(v, s) || s < 0) return false;
            c.seed = static_cast<uint32_t>(s);
            return true; }},
    };
    return table;
}

static const Option* findOption(const std::string& name) {
    for (const auto& o : options()) if (name == o.name) return &o;
    return nullptr;
}

static std::string envNameFor(const char* option) {
    std::string s = "MATTERWAVE_";
    for (const char* p = option; *p; ++p) s += (*p == '-') ? '_' : (char)std::toupper((unsigned char)*p);
    return s;
}

template <class T>
static bool clampField(T& v, T lo, T hi) {
    T c = std::max(lo, std::min(hi, v));
    if (c == v) return false;
    v = c;
    return true;
}

static bool clampReal(float& v, float lo, float hi, float fallback) {
    if (!std::isfinite(v)) { v = fallback; return true; }
    return clampField(v, lo, hi);
}

static bool clampReal(double& v, double lo, double hi, double fallback) {
    if (!std::isfinite(v)) { v = fallback; return true; }
    return clampField(v, lo, hi);
}
}

int SimConfig::sanitize() {
    const SimConfig d;
    int changed = 0;
    changed += clampField(rows, 10, 1000);
    changed += clampField(cols, 10, 1000);
    changed += clampField(speedMs, 10, 400);
    changed += clampReal(density, 0.0, 1.0, d.density);

    changed += clampReal(medium.hopHz, 0.0f, 20.0f, d.medium.hopHz);
    changed += clampReal(medium.hopStrength, 0.0f, 3.0f, d.medium.hopStrength);
    changed += clampReal(medium.memoryRate, 0.0f, 0.3f, d.medium.memoryRate);
    changed += clampReal(medium.memoryCoupling, 0.0f, 60.0f, d.medium.memoryCoupling);
    changed += clampReal(medium.nonlinearity, 0.0f, 60.0f, d.medium.nonlinearity);
    changed += clampReal(medium.noiseIntensity, 0.0f, 1.0f, d.medium.noiseIntensity);
    changed += clampField(medium.noiseBlobSize, 1, 20);
    changed += clampReal(medium.waveSpeedSq, 0.0f, 64.0f, d.medium.waveSpeedSq);
    changed += clampReal(medium.damping, 0.0f, 60.0f, d.medium.damping);
    changed += clampReal(medium.dispersion, 0.0f, 4.0f, d.medium.dispersion);
    changed += clampReal(generationTime, 0.005, 0.2, d.generationTime);
    changed += clampField(mediumSubsteps, 1, 16);

    changed += clampReal(nucleationThreshold, 0.01f, 2.0f, d.nucleationThreshold);
    changed += clampField(cooldownTicks, 1, 600);
    changed += clampField(maxNucleiPerScan, 0, 64);
    changed += clampReal(annihilationBurst, 0.0f, 1.0f, d.annihilationBurst);

    if (changed > 0) Logger::debug("SimConfig::sanitize: clamped " + std::to_string(changed) + " field(s)");
    return changed;
}

int SimConfig::effectiveSubsteps() const {
    int needed = (int)std::ceil(generationTime / MaxSubstepDt - 1e-9);
    return std::max(std::max(1, mediumSubsteps), needed);
}

NucleationParams SimConfig::nucleationParams() const {
    NucleationParams p;
    p.threshold = nucleationThreshold;
    p.cooldownTicks = cooldownTicks;
    p.maxNucleiPerScan = maxNucleiPerScan;
    p.antimatterEnabled = antimatterEnabled;
    return p;
}

std::string SimConfig::summary() const {
    std::ostringstream oss;
    oss << rows << "x" << cols << (wrap ? " wrap" : " bounded")
        << " speedMs=" << speedMs
        << " medium=" << (mediumMode == MediumMode::Off ? "off" : "nucleation")
        << " antimatter=" << (antimatterEnabled ? "on" : "off")
        << " hopHz=" << medium.hopHz << " hopStrength=" << medium.hopStrength
        << " tau=" << nucleationThreshold
        << " c2=" << medium.waveSpeedSq << " gamma=" << medium.damping << " kappa=" << medium.dispersion
        << " noise=" << (medium.noiseEnabled ? medium.noiseIntensity : 0.0f)
        << " dt/gen=" << generationTime << " substeps=" << effectiveSubsteps()
        << " seed=" << seed;
    return oss.str();
}

void applyEnvOverrides(SimConfig& cfg, AppliedOptions* applied) {
    for (const auto& o : options()) {
        const std::string env = envNameFor(o.name);
        const char* v = std::getenv(env.c_str());
        if (!v) continue;
        if (!o.set(cfg, v)) {
            Logger::warn("ignoring " + env + "=" + v + ": not a valid value");
            continue;
        }
        if (applied) applied->insert(o.name);
    }
}

std::vector<std::string> applyArgOverrides(SimConfig& cfg, int argc, char** argv, AppliedOptions* applied) {
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind("--", 0) != 0) { rest.push_back(a); continue; }
        std::string name = a.substr(2);
        std::string value;
        bool haveValue = false;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            haveValue = true;
        }
        const Option* o = findOption(name);
        if (!o) { rest.push_back(a); continue; }
        if (!haveValue) {
            if (i + 1 >= argc) { Logger::warn("missing value for --" + name); continue; }
            value = argv[++i];
        }
        if (!o->set(cfg, value.c_str())) {
            Logger::warn("ignoring --" + name + "=" + value + ": not a valid value");
            continue;
        }
        if (applied) applied->insert(o->name);
    }
    return rest;
}

std::vector<std::string> configOptionNames() {
    std::vector<std::string> names;
    for (const auto& o : options()) names.emplace_back(o.name);
    return names;
}
