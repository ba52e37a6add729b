#pragma once

#include "boundary.h"

#include <cstddef>
#include <string>
#include <vector>

namespace wordmatch {

// Offsets into the canonical contents. Only the start is tracked:
// a marker is recorded as (start, start) and never widened.
struct WordMarker {
    size_t start = 0;
    size_t end = 0;
};

inline bool operator==(const WordMarker& lhs, const WordMarker& rhs) {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

inline bool operator!=(const WordMarker& lhs, const WordMarker& rhs) {
    return !(lhs == rhs);
}

struct ScanResult {
    std::vector<Boundary> boundaries;
    std::vector<bool> checked;
    std::vector<WordMarker> word_markers;
};

// Whitespace or control character
bool is_filler(char32_t c);

/**
 * Classify every canonical character in one left-to-right pass with a
 * single character of lookahead. boundaries and checked have one entry per
 * character; word_markers gets one entry per Start or Mixed boundary.
 */
ScanResult scan(const std::u32string& canonical);

} // namespace wordmatch
