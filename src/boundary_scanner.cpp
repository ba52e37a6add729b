#include "wordmatch/boundary_scanner.h"
#include "wordmatch/unicode_utils.h"

namespace wordmatch {

bool is_filler(char32_t c) {
    return unicode::is_whitespace(c) || unicode::is_control(c);
}

ScanResult scan(const std::u32string& canonical) {
    ScanResult result;
    result.boundaries.reserve(canonical.size());
    result.checked.reserve(canonical.size());

    const size_t length = canonical.size();
    for (size_t i = 0; i < length; ++i) {
        // End of input behaves like a filler character
        const bool next_is_filler = i + 1 >= length || is_filler(canonical[i + 1]);

        Boundary boundary;
        if (is_filler(canonical[i])) {
            boundary = Boundary::NoContent;
        } else if (!result.boundaries.empty() && is_word(result.boundaries.back())) {
            boundary = next_is_filler ? Boundary::End : Boundary::Word;
        } else {
            result.word_markers.push_back(WordMarker{i, i});
            boundary = next_is_filler ? Boundary::Mixed : Boundary::Start;
        }

        result.checked.push_back(false);
        result.boundaries.push_back(boundary);
    }

    return result;
}

} // namespace wordmatch
