/**
 * @file MediumField.cpp
 * @brief MediumField implementation: explicit damped wave scheme with dispersion, memory, hops and noise.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "MediumField.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace {
constexpr double TwoPi = 6.283185307179586;

inline float finiteOr0(float v) { return std::isfinite(v) ? v : 0.0f; }
inline float clampf(float v, float lo, float hi) { return std::max(lo, std::min(hi, v)); }
inline float safeAmp(float v) { return clampf(finiteOr0(v), -MediumField::AmplitudeClamp, MediumField::AmplitudeClamp); }
}

MediumField::MediumField(int width, int height, bool wrap) {
    topo.wrap = wrap;
    reallocate(width, height);
}

void MediumField::reallocate(int width, int height) {
    topo.cols = std::max(1, width);
    topo.rows = std::max(1, height);
    const size_t n = (size_t)topo.cellCount();
    prev.assign(n, 0.0f);
    curr.assign(n, 0.0f);
    next.assign(n, 0.0f);
    lap1.assign(n, 0.0f);
    lap2.assign(n, 0.0f);
    mem.assign(n, 0.0f);
    src.assign(n, 0.0f);
    cool.assign(n, 0);
    seen.assign(n, 0);
    hopPhase = 0.0;
    hops = 0;
    haveGeneration = false;
    lastGeneration = 0;
    Logger::info("MediumField: allocated " + std::to_string(topo.cols) + "x" + std::to_string(topo.rows));
}

void MediumField::reset() {
    std::fill(prev.begin(), prev.end(), 0.0f);
    std::fill(curr.begin(), curr.end(), 0.0f);
    std::fill(next.begin(), next.end(), 0.0f);
    std::fill(lap1.begin(), lap1.end(), 0.0f);
    std::fill(lap2.begin(), lap2.end(), 0.0f);
    std::fill(mem.begin(), mem.end(), 0.0f);
    std::fill(src.begin(), src.end(), 0.0f);
    std::fill(cool.begin(), cool.end(), (uint16_t)0);
    std::fill(seen.begin(), seen.end(), (uint8_t)0);
    hopPhase = 0.0;
    hops = 0;
}

bool MediumField::syncGeneration(uint64_t generation) {
    if (!haveGeneration) {
        haveGeneration = true;
        lastGeneration = generation;
        return false;
    }
    const bool regressed = generation < lastGeneration;
    const bool skipped = generation > lastGeneration + 1;
    lastGeneration = generation;
    if (!regressed && !skipped) return false;
    reset();
    Logger::info(std::string("MediumField: generation ") + (regressed ? "regressed" : "skipped") +
                 " to " + std::to_string(generation) + ", field reset");
    return true;
}

void MediumField::setAmplitude(int x, int y, float v) {
    if (x < 0 || y < 0 || x >= topo.cols || y >= topo.rows) return;
    const size_t i = (size_t)index(x, y);
    curr[i] = v;
    prev[i] = v;
}

void MediumField::addImpulse(int idx, float amount) {
    if (idx < 0 || idx >= size()) return;
    curr[(size_t)idx] += amount;
    prev[(size_t)idx] -= amount;
}

void MediumField::laplacianInto(const GridTopology& t, const std::vector<float>& in, std::vector<float>& out) {
    const int w = t.cols;
    const int h = t.rows;
    for (int y = 0; y < h; ++y) {
        const int yUp = t.foldRow(y - 1);
        const int yDown = t.foldRow(y + 1);
        for (int x = 0; x < w; ++x) {
            const int xLeft = t.foldCol(x - 1);
            const int xRight = t.foldCol(x + 1);
            const float center = finiteOr0(in[(size_t)(y * w + x)]);
            const float left = finiteOr0(in[(size_t)(y * w + xLeft)]);
            const float right = finiteOr0(in[(size_t)(y * w + xRight)]);
            const float up = finiteOr0(in[(size_t)(yUp * w + x)]);
            const float down = finiteOr0(in[(size_t)(yDown * w + x)]);
            out[(size_t)(y * w + x)] = left + right + up + down - 4.0f * center;
        }
    }
}

void MediumField::boxBlur3x3(const GridTopology& t, const std::vector<float>& in, std::vector<float>& out) {
    const int w = t.cols;
    const int h = t.rows;
    for (int y = 0; y < h; ++y) {
        const int ym1 = t.foldRow(y - 1);
        const int yp1 = t.foldRow(y + 1);
        for (int x = 0; x < w; ++x) {
            const int xm1 = t.foldCol(x - 1);
            const int xp1 = t.foldCol(x + 1);
            const float sum =
                finiteOr0(in[(size_t)(ym1 * w + xm1)]) + finiteOr0(in[(size_t)(ym1 * w + x)]) + finiteOr0(in[(size_t)(ym1 * w + xp1)]) +
                finiteOr0(in[(size_t)(y * w + xm1)])   + finiteOr0(in[(size_t)(y * w + x)])   + finiteOr0(in[(size_t)(y * w + xp1)]) +
                finiteOr0(in[(size_t)(yp1 * w + xm1)]) + finiteOr0(in[(size_t)(yp1 * w + x)]) + finiteOr0(in[(size_t)(yp1 * w + xp1)]);
            out[(size_t)(y * w + x)] = sum / 9.0f;
        }
    }
}

void MediumField::integrate(int steps, double totalDt, const MediumParams& params, std::mt19937& rng) {
    if (!std::isfinite(totalDt) || totalDt <= 0.0) return;
    if (steps < 1) steps = 1;
    const double h = totalDt / steps;
    for (int sub = 0; sub < steps; ++sub) {
        advanceHop(params, h);
        injectNoise(params, rng);
        if (params.memoryRate > 0.0f) updateMemory(params.memoryRate);
        advance(params, (float)h);
    }
}

void MediumField::advanceHop(const MediumParams& p, double h) {
    if (!(p.hopHz > 0.0f)) return;
    hopPhase += TwoPi * (double)p.hopHz * h;
    while (hopPhase >= TwoPi) {
        hopPhase -= TwoPi;
        ++hops;
        if (!(p.hopStrength > 0.0f)) continue;
        // A hit, not a drive: displacement plus matching velocity.
        const size_t n = curr.size();
        for (size_t i = 0; i < n; ++i) {
            const float a = p.hopStrength * src[i];
            if (a == 0.0f || !std::isfinite(a)) continue;
            curr[i] += a;
            prev[i] -= a;
        }
    }
}

void MediumField::injectNoise(const MediumParams& p, std::mt19937& rng) {
    if (!p.noiseEnabled) return;
    const float intensity = clampf(finiteOr0(p.noiseIntensity), 0.0f, 1.0f);
    if (intensity <= 0.0f) return;

    const int w = topo.cols;
    const int h = topo.rows;
    std::uniform_real_distribution<float> u01(0.0f, 1.0f);
    const float base = (float)(w * h) / 4096.0f;
    const int blobs = (int)std::floor(intensity * 1.5f * base + (u01(rng) < intensity * 0.2f ? 1.0f : 0.0f));
    if (blobs <= 0) return;

    const int size = std::max(1, std::min(20, p.noiseBlobSize));
    const float amplitude = 0.4f * intensity;
    std::uniform_int_distribution<int> xDist(0, w - 1);
    std::uniform_int_distribution<int> yDist(0, h - 1);

    for (int b = 0; b < blobs; ++b) {
        const int cx = xDist(rng);
        const int cy = yDist(rng);
        const float a = (u01(rng) < 0.5f) ? -amplitude : amplitude;
        if (p.noiseShape == BlobShape::Disk) {
            const int r = size;
            for (int dy = -r; dy <= r; ++dy) {
                for (int dx = -r; dx <= r; ++dx) {
                    if (dx * dx + dy * dy > r * r) continue;
                    curr[(size_t)topo.foldKey(cy + dy, cx + dx)] += a;
                }
            }
        } else {
            for (int dy = 0; dy < size; ++dy) {
                for (int dx = 0; dx < size; ++dx) {
                    curr[(size_t)topo.foldKey(cy + dy, cx + dx)] += a;
                }
            }
        }
    }
}

void MediumField::updateMemory(float rate) {
    const float r = clampf(rate, 0.0f, 1.0f);
    const float keep = 1.0f - r;
    const size_t n = curr.size();
    for (size_t i = 0; i < n; ++i) {
        const float m = keep * finiteOr0(mem[i]) + r * safeAmp(curr[i]);
        mem[i] = finiteOr0(m);
    }
}

void MediumField::advance(const MediumParams& p, float h) {
    laplacianInto(topo, curr, lap1);
    laplacianInto(topo, lap1, lap2);

    const float dt2 = h * h;
    const float gFactor = p.damping * h * 0.5f;
    const float denom = 1.0f + gFactor;
    const float c2 = p.waveSpeedSq;
    const float kappa = p.dispersion;
    const float nl = p.nonlinearity;
    const float mk = p.memoryCoupling;

    const size_t n = curr.size();
    for (size_t i = 0; i < n; ++i) {
        const float u = safeAmp(curr[i]);
        const float up = finiteOr0(prev[i]);
        const float nonlinearTerm = -nl * u * u * u;
        const float memoryTerm = (mk != 0.0f) ? mk * safeAmp(mem[i]) : 0.0f;
        const float rhs = c2 * finiteOr0(lap1[i]) - kappa * finiteOr0(lap2[i]) + nonlinearTerm + memoryTerm;
        const float v = (2.0f * u - up * (1.0f - gFactor) + dt2 * rhs) / denom;
        next[i] = finiteOr0(v);
    }

    // prev <- curr, curr <- next, next <- old prev (storage swap only)
    prev.swap(curr);
    curr.swap(next);
}

double MediumField::energy() const {
    double e = 0.0;
    for (float v : curr) e += (double)v * (double)v;
    return e;
}

double MediumField::meanAmplitude(int stride) const {
    if (stride < 1) stride = 1;
    double sum = 0.0;
    size_t count = 0;
    for (size_t i = 0; i < curr.size(); i += (size_t)stride) {
        sum += finiteOr0(curr[i]);
        ++count;
    }
    return count > 0 ? sum / (double)count : 0.0;
}
