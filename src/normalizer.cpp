#include "wordmatch/normalizer.h"
#include "wordmatch/unicode_utils.h"

#include <iostream>
#include <utility>

namespace wordmatch {

namespace {

std::shared_ptr<const ConfusableTable> empty_table() {
    static const auto table = std::make_shared<const ConfusableTable>();
    return table;
}

} // namespace

Normalizer::Normalizer() : table_(empty_table()) {}

Normalizer::Normalizer(std::shared_ptr<const ConfusableTable> table)
    : table_(table ? std::move(table) : empty_table()) {}

std::u32string Normalizer::substitute(const std::u32string& input) const {
    if (!debug_) {
        return table_->replace(input);
    }
    std::u32string result;
    result.reserve(input.size());
    for (char32_t c : input) {
        const std::u32string* replacement = table_->lookup(c);
        if (!replacement) {
            result.push_back(c);
            continue;
        }
        std::cerr << "[normalizer] substitute: '" << unicode::from_code_points(std::u32string(1, c))
                  << "' -> '" << unicode::from_code_points(*replacement) << "'\n";
        result += *replacement;
    }
    return result;
}

std::u32string Normalizer::normalize_chars(const std::string& raw) const {
    return unicode::to_lower(substitute(unicode::to_code_points(raw)));
}

std::string Normalizer::normalize(const std::string& raw) const {
    return unicode::from_code_points(normalize_chars(raw));
}

} // namespace wordmatch
