#include "wordmatch/io_json.h"

#include <utility>

namespace wordmatch {

nlohmann::json sentence_to_json(const Sentence& sentence, bool include_markers) {
    nlohmann::json out;
    out["text"] = sentence.to_string();
    out["length"] = sentence.length();

    nlohmann::json boundaries = nlohmann::json::array();
    for (Boundary boundary : sentence.boundaries()) {
        boundaries.push_back(boundary_name(boundary));
    }
    out["boundaries"] = std::move(boundaries);

    nlohmann::json checked = nlohmann::json::array();
    for (bool flag : sentence.checked()) {
        checked.push_back(flag);
    }
    out["checked"] = std::move(checked);

    if (include_markers) {
        nlohmann::json markers = nlohmann::json::array();
        for (const auto& marker : sentence.word_markers()) {
            markers.push_back({marker.start, marker.end});
        }
        out["word_markers"] = std::move(markers);
    }
    return out;
}

std::string dump_sentence(const Sentence& sentence, bool include_markers, int indent) {
    return sentence_to_json(sentence, include_markers).dump(indent);
}

std::string boundary_codes(const Sentence& sentence) {
    std::string codes;
    codes.reserve(sentence.length());
    for (Boundary boundary : sentence.boundaries()) {
        codes.push_back(boundary_code(boundary));
    }
    return codes;
}

} // namespace wordmatch
