#include "wordmatch/sentence.h"
#include "wordmatch/unicode_utils.h"

#include <stdexcept>
#include <utility>

namespace wordmatch {

Sentence::Sentence(const std::string& raw) : Sentence(raw, Normalizer()) {}

Sentence::Sentence(const std::string& raw, const Normalizer& normalizer)
    : contents_(normalizer.normalize_chars(raw)) {
    annotate();
}

void Sentence::annotate() {
    ScanResult result = scan(contents_);
    boundaries_ = std::move(result.boundaries);
    checked_ = std::move(result.checked);
    word_markers_ = std::move(result.word_markers);
}

std::string Sentence::to_string() const {
    return unicode::from_code_points(contents_);
}

void Sentence::set_checked(size_t index, bool value) {
    if (index >= checked_.size()) {
        throw std::out_of_range("Sentence::set_checked: index " + std::to_string(index) +
                                " out of range for length " + std::to_string(checked_.size()));
    }
    checked_[index] = value;
}

std::ostream& operator<<(std::ostream& os, const Sentence& sentence) {
    return os << sentence.to_string();
}

} // namespace wordmatch
