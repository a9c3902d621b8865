/**
 * @file MediumField.h
 * @brief Declares MediumField: a dense damped nonlinear wave field integrated with an explicit scheme.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "GridTopology.h"

#include <cstdint>
#include <random>
#include <vector>

/** @brief Shape of an ambient noise blob. */
enum class BlobShape { Square, Disk };

/**
 * @struct MediumParams
 * @brief Physical and forcing parameters consumed by MediumField::integrate().
 *
 * Values are used as given; range clamping happens once at the configuration boundary
 * (SimConfig::sanitize) so the integrator stays branch-free in its inner loops.
 */
struct MediumParams {
    float waveSpeedSq{36.0f};    /**< c^2 in grid units */
    float damping{2.2f};         /**< gamma */
    float dispersion{2.0f};      /**< kappa, weight of the biharmonic term */
    float nonlinearity{8.0f};    /**< cubic softening coefficient */
    float memoryRate{0.04f};     /**< leaky memory rate r, [0,0.3] */
    float memoryCoupling{10.0f}; /**< weight of the memory feedback term */
    float hopHz{4.0f};           /**< hop frequency; 0 disables hops */
    float hopStrength{1.0f};     /**< impulse scale applied to the source map per hop */
    bool noiseEnabled{true};     /**< ambient noise on/off */
    float noiseIntensity{0.04f}; /**< [0,1]; scales blob count and amplitude */
    int noiseBlobSize{4};        /**< square edge or disk radius, in medium cells */
    BlobShape noiseShape{BlobShape::Disk};
};

/**
 * @class MediumField
 * @brief Owns the medium buffers and advances the wave equation
 *        u_tt + gamma u_t = c^2 Lap u - kappa Lap^2 u - n u^3 + k m.
 *
 * Buffers (all width*height, row-major):
 * - three amplitude buffers rotated as prev/curr/next by swap
 * - two scratch buffers (Laplacian and biharmonic, reused by blur passes)
 * - leaky memory, signed source density, per-cell cooldown, visited bitmap
 *
 * Any non-finite value read from a buffer is treated as 0 and any non-finite result is
 * stored as 0, so a single corrupted cell can not spread through the stencil.
 */
class MediumField {
public:
    /** @brief Largest |u| or |m| fed into a nonlinear term. */
    static constexpr float AmplitudeClamp = 2.0f;

    /** @brief Allocate a zeroed field of @p width x @p height cells. */
    MediumField(int width, int height, bool wrap);

    /** @brief Reallocate to a new size; all buffers, the hop phase and the generation guard are reset. */
    void reallocate(int width, int height);
    /** @brief Switch stencil topology (wrap or clamp at the edges). */
    void setWrap(bool wrap) { topo.wrap = wrap; }
    /** @brief Zero every buffer and the hop phase. Dimensions are kept. */
    void reset();

    /**
     * @brief Record the automaton generation that is about to drive integration.
     *
     * A regression, or a jump of more than one generation, zeroes the whole field
     * instead of trying to catch up.
     * @return true if the field was reset
     */
    bool syncGeneration(uint64_t generation);

    /**
     * @brief Advance by exactly @p totalDt split into @p steps equal substeps.
     * @param rng source for ambient noise placement (untouched when noise is off)
     */
    void integrate(int steps, double totalDt, const MediumParams& params, std::mt19937& rng);

    // Diagnostics
    /** @brief Sum of squared amplitudes. */
    double energy() const;
    /** @brief Mean amplitude sampled every @p stride cells. */
    double meanAmplitude(int stride = 8) const;
    /** @brief Number of hop impulses injected since the last reset. */
    uint64_t hopCount() const { return hops; }
    /** @brief Current hop phase in [0,2*pi). */
    double phase() const { return hopPhase; }

    // Geometry
    int width() const { return topo.cols; }
    int height() const { return topo.rows; }
    int size() const { return topo.cellCount(); }
    /** @brief Stencil topology: rows=height, cols=width. */
    const GridTopology& topology() const { return topo; }
    int index(int x, int y) const { return y * topo.cols + x; }

    // Buffer access
    /** @brief Current amplitude buffer (the one renderers show). */
    const std::vector<float>& amplitude() const { return curr; }
    /** @brief Previous amplitude buffer; writing it changes the implied velocity. */
    const std::vector<float>& previousAmplitude() const { return prev; }
    float amplitudeAt(int x, int y) const { return curr[(size_t)index(x, y)]; }
    /** @brief Set a displacement at rest: both curr and prev receive @p v. */
    void setAmplitude(int x, int y, float v);
    /** @brief Add a velocity-carrying impulse: +@p amount into curr, -@p amount into prev. */
    void addImpulse(int idx, float amount);

    std::vector<float>& source() { return src; }
    const std::vector<float>& source() const { return src; }
    const std::vector<float>& memory() const { return mem; }
    std::vector<uint16_t>& cooldown() { return cool; }
    const std::vector<uint16_t>& cooldown() const { return cool; }
    std::vector<uint8_t>& visited() { return seen; }
    /** @brief First scratch buffer; contents are only valid inside the caller's own pass. */
    std::vector<float>& scratchA() { return lap1; }
    /** @brief Second scratch buffer. */
    std::vector<float>& scratchB() { return lap2; }

    // Stencils shared with the coupling and nucleation code
    /** @brief 5-point Laplacian of @p in into @p out under @p t (non-finite reads count as 0). */
    static void laplacianInto(const GridTopology& t, const std::vector<float>& in, std::vector<float>& out);
    /** @brief 3x3 box blur of @p in into @p out under @p t. @p in and @p out must differ. */
    static void boxBlur3x3(const GridTopology& t, const std::vector<float>& in, std::vector<float>& out);

private:
    /** @brief Advance the hop phase by one substep and inject one impulse per full turn. */
    void advanceHop(const MediumParams& p, double h);
    /** @brief Drop random signed blobs into curr. */
    void injectNoise(const MediumParams& p, std::mt19937& rng);
    /** @brief m = (1-r) m + r u with clamped, finite u. */
    void updateMemory(float rate);
    /** @brief One explicit update into next, then rotate prev/curr/next. */
    void advance(const MediumParams& p, float h);

    GridTopology topo;            /**< rows=height, cols=width */
    std::vector<float> prev;      /**< u at t-h */
    std::vector<float> curr;      /**< u at t */
    std::vector<float> next;      /**< u at t+h (scratch until rotation) */
    std::vector<float> lap1;      /**< Laplacian scratch */
    std::vector<float> lap2;      /**< biharmonic scratch */
    std::vector<float> mem;       /**< leaky memory */
    std::vector<float> src;       /**< signed source density */
    std::vector<uint16_t> cool;   /**< nucleation cooldown ticks */
    std::vector<uint8_t> seen;    /**< flood-fill visited bitmap */

    double hopPhase{0.0};         /**< hop phase accumulator */
    uint64_t hops{0};             /**< hop impulses since reset */
    bool haveGeneration{false};   /**< whether lastGeneration is meaningful */
    uint64_t lastGeneration{0};   /**< last generation seen by syncGeneration */
};
