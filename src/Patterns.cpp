/**
 * @file Patterns.cpp
 * @brief Built-in pattern table and '#'-art helpers.
 */
#include "Patterns.h"

#include <algorithm>
#include <cmath>

const std::vector<NamedPattern>& builtinPatterns() {
    static const std::vector<NamedPattern> table = {
        {"blinker", "OOO: three in a row", {"###"}},
        {"l3", "L: OO / .O", {"##", ".#"}},
        {"shifted", "double block: OO. / .OO", {"##.", ".##"}},
        {"block", "2x2 still life", {"##", "##"}},
        {"glider", "glider heading south-east", {".#.", "..#", "###"}},
    };
    return table;
}

const NamedPattern* findPattern(const std::string& name) {
    for (const auto& p : builtinPatterns()) if (p.name == name) return &p;
    return nullptr;
}

void patternExtent(const PatternLines& lines, int& height, int& width) {
    height = (int)lines.size();
    width = 0;
    for (const auto& l : lines) width = std::max(width, (int)l.size());
}

CellBatch patternCells(const PatternLines& lines, int top, int left) {
    CellBatch out;
    for (int pr = 0; pr < (int)lines.size(); ++pr) {
        const std::string& line = lines[(size_t)pr];
        for (int pc = 0; pc < (int)line.size(); ++pc) {
            if (line[(size_t)pc] != '#') continue;
            out.emplace_back(top + pr, left + pc);
        }
    }
    return out;
}

void centeredOrigin(const PatternLines& lines, int rows, int cols, int& top, int& left) {
    int h = 0, w = 0;
    patternExtent(lines, h, w);
    // floor, not truncation: patterns larger than the grid start above/left of it
    top = (int)std::floor((rows - h) / 2.0);
    left = (int)std::floor((cols - w) / 2.0);
}
