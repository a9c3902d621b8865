/**
 * @file CouplingAdapter.cpp
 * @brief CouplingAdapter implementation: nearest-cell mapping and source map construction.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "CouplingAdapter.h"
#include "AutomatonEngine.h"
#include "MediumField.h"

#include <algorithm>

namespace {
inline int clampi(int v, int lo, int hi) { return std::max(lo, std::min(hi, v)); }
}

CouplingAdapter::MediumSize CouplingAdapter::chooseResolution(int rows, int cols) {
    MediumSize s;
    s.width = clampi(cols / DownsampleFactor, MinMediumDim, MaxMediumDim);
    s.height = clampi(rows / DownsampleFactor, MinMediumDim, MaxMediumDim);
    return s;
}

CouplingAdapter::CouplingAdapter(int rows, int cols, int mediumWidth, int mediumHeight)
    : autoRows(1), autoCols(1), medW(1), medH(1) {
    configure(rows, cols, mediumWidth, mediumHeight);
}

void CouplingAdapter::configure(int rows, int cols, int mediumWidth, int mediumHeight) {
    autoRows = std::max(1, rows);
    autoCols = std::max(1, cols);
    medW = std::max(1, mediumWidth);
    medH = std::max(1, mediumHeight);
}

void CouplingAdapter::toMedium(int r, int c, int& x, int& y) const {
    x = clampi((int)((long long)c * medW / autoCols), 0, medW - 1);
    y = clampi((int)((long long)r * medH / autoRows), 0, medH - 1);
}

int CouplingAdapter::mediumIndexOfKey(int key) const {
    int x = 0, y = 0;
    toMedium(key / autoCols, key % autoCols, x, y);
    return y * medW + x;
}

void CouplingAdapter::toAutomaton(int x, int y, int& r, int& c) const {
    // Cell centre: floor((y + 0.5) * rows / H) in integer arithmetic.
    r = clampi((int)(((2LL * y + 1) * autoRows) / (2LL * medH)), 0, autoRows - 1);
    c = clampi((int)(((2LL * x + 1) * autoCols) / (2LL * medW)), 0, autoCols - 1);
}

double CouplingAdapter::cellAreaRatio() const {
    return ((double)autoCols / medW) * ((double)autoRows / medH);
}

void CouplingAdapter::rebuildSource(const AutomatonEngine& engine, MediumField& field) const {
    std::vector<float>& src = field.source();
    std::fill(src.begin(), src.end(), 0.0f);
    if ((int)src.size() != medW * medH) return;

    for (int k : engine.matter()) src[(size_t)mediumIndexOfKey(k)] += MatterSign;
    if (engine.antimatterEnabled()) {
        for (int k : engine.antimatter()) src[(size_t)mediumIndexOfKey(k)] -= MatterSign;
    }

    const double ratio = cellAreaRatio();
    const float inv = ratio > 0.0 ? (float)(1.0 / ratio) : 1.0f;
    for (float& v : src) v *= inv;

    std::vector<float>& tmp = field.scratchA();
    tmp = src;
    MediumField::boxBlur3x3(field.topology(), tmp, src);
}
