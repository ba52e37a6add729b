#pragma once

#include "boundary.h"
#include "boundary_scanner.h"
#include "normalizer.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace wordmatch {

/**
 * Normalized text annotated with word boundaries.
 *
 * contents, boundaries and word markers are fixed at construction.
 * checked is owned here but written by the matching layer; it is not
 * synchronized, so concurrent matchers must partition or lock it.
 */
class Sentence {
public:
    // Lowercases only: the default Normalizer carries an empty confusable
    // table, so homoglyphs are kept. Pass a Normalizer built from a table
    // to fold them.
    explicit Sentence(const std::string& raw);
    Sentence(const std::string& raw, const Normalizer& normalizer);

    // Number of canonical characters
    size_t length() const { return contents_.size(); }

    // Normalized rendering, not the raw input
    std::string to_string() const;

    const std::vector<Boundary>& boundaries() const { return boundaries_; }

    std::vector<bool>& checked() { return checked_; }
    const std::vector<bool>& checked() const { return checked_; }

    // Throws std::out_of_range
    void set_checked(size_t index, bool value = true);

    // Matching layer only
    const std::u32string& contents() const { return contents_; }
    const std::vector<WordMarker>& word_markers() const { return word_markers_; }

private:
    std::u32string contents_;
    std::vector<Boundary> boundaries_;
    std::vector<bool> checked_;
    std::vector<WordMarker> word_markers_;

    void annotate();
};

std::ostream& operator<<(std::ostream& os, const Sentence& sentence);

} // namespace wordmatch
