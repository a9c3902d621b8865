/**
 * @file GridTopology.h
 * @brief Addressing rules shared by the automaton and the medium: bounded (hard edges) or toroidal.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

/**
 * @struct GridTopology
 * @brief Row-major grid of @c rows x @c cols cells; @c wrap selects toroidal addressing.
 *
 * Two resolution policies are offered. resolve() is used for automaton cells and discards
 * out-of-range coordinates on a bounded grid. fold() is used by the medium stencils and
 * clamps to the nearest edge cell instead.
 */
struct GridTopology {
    int rows{0};     /**< number of rows (y extent) */
    int cols{0};     /**< number of columns (x extent) */
    bool wrap{true}; /**< toroidal when true, bounded otherwise */

    /** @brief Total number of cells. */
    int cellCount() const { return rows * cols; }
    /** @brief Whether (r,c) lies inside the grid without any wrapping. */
    bool inBounds(int r, int c) const { return r >= 0 && c >= 0 && r < rows && c < cols; }

    /** @brief Flattened key for an in-bounds coordinate. */
    int key(int r, int c) const { return r * cols + c; }
    /** @brief Row of a flattened key. */
    int rowOf(int k) const { return k / cols; }
    /** @brief Column of a flattened key. */
    int colOf(int k) const { return k % cols; }

    /**
     * @brief Resolve (r,c) in place: wrap modulo the dimensions, or reject when bounded.
     * @return false if the coordinate is outside a bounded grid (caller drops it).
     */
    bool resolve(int& r, int& c) const {
        if (rows <= 0 || cols <= 0) return false;
        if (wrap) {
            r = wrapIndex(r, rows);
            c = wrapIndex(c, cols);
            return true;
        }
        return inBounds(r, c);
    }

    /** @brief Wrap or clamp a row index (stencil policy). */
    int foldRow(int r) const { return wrap ? wrapIndex(r, rows) : clampIndex(r, rows); }
    /** @brief Wrap or clamp a column index (stencil policy). */
    int foldCol(int c) const { return wrap ? wrapIndex(c, cols) : clampIndex(c, cols); }
    /** @brief Flattened key after folding both coordinates. */
    int foldKey(int r, int c) const { return key(foldRow(r), foldCol(c)); }

    bool operator==(const GridTopology& o) const { return rows == o.rows && cols == o.cols && wrap == o.wrap; }
    bool operator!=(const GridTopology& o) const { return !(*this == o); }

    /** @brief Euclidean modulo: result always in [0,n). */
    static int wrapIndex(int v, int n) {
        int m = v % n;
        return m < 0 ? m + n : m;
    }
    /** @brief Clamp to [0,n-1]. */
    static int clampIndex(int v, int n) {
        if (v < 0) return 0;
        if (v >= n) return n - 1;
        return v;
    }
};
