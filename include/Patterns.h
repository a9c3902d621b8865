/**
 * @file Patterns.h
 * @brief Built-in starter patterns and helpers turning '#'-art into cell batches.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "AutomatonEngine.h"

#include <string>
#include <vector>

using PatternLines = std::vector<std::string>; /**< rows of '#' (live) and anything else (dead) */

/** @brief A named pattern offered by the driver. */
struct NamedPattern {
    std::string name;   /**< short id used on the command line */
    std::string label;  /**< human readable description */
    PatternLines lines; /**< pattern art */
};

/** @brief All built-in patterns, in menu order. */
const std::vector<NamedPattern>& builtinPatterns();
/** @brief Look up a built-in pattern by name; nullptr if unknown. */
const NamedPattern* findPattern(const std::string& name);

/** @brief Height (line count) and width (longest line) of @p lines. */
void patternExtent(const PatternLines& lines, int& height, int& width);
/** @brief Coordinates of every '#' with the pattern's top-left corner at (top,left). Not resolved. */
CellBatch patternCells(const PatternLines& lines, int top, int left);
/** @brief Top-left corner that centres @p lines on a rows x cols grid: floor((rows-h)/2), floor((cols-w)/2). */
void centeredOrigin(const PatternLines& lines, int rows, int cols, int& top, int& left);
