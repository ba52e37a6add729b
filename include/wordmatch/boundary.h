#pragma once

#include <ostream>

namespace wordmatch {

// Role of a canonical character within word segmentation
enum class Boundary {
    Start,      // first character of a word, more word characters follow
    Word,       // interior character of a multi-character word
    End,        // last character of a multi-character word
    Mixed,      // one-character word, both start and end
    NoContent   // whitespace or control filler, never part of a word
};

bool is_word(Boundary boundary);

const char* boundary_name(Boundary boundary);

// One-letter code used by the text output format: S W E M _
char boundary_code(Boundary boundary);

std::ostream& operator<<(std::ostream& os, Boundary boundary);

} // namespace wordmatch
