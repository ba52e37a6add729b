#pragma once

#include "sentence.h"

#include <nlohmann/json.hpp>

#include <string>

namespace wordmatch {

nlohmann::json sentence_to_json(const Sentence& sentence, bool include_markers = false);

// indent < 0 gives a single line
std::string dump_sentence(const Sentence& sentence, bool include_markers = false, int indent = -1);

// One code per character, see boundary_code()
std::string boundary_codes(const Sentence& sentence);

} // namespace wordmatch
