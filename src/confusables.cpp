#include "wordmatch/confusables.h"
#include "wordmatch/unicode_utils.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace wordmatch {

ConfusableTable::ConfusableTable(std::unordered_map<char32_t, std::u32string> entries)
    : entries_(std::move(entries)) {}

ConfusableTable ConfusableTable::from_json(const std::string& text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(std::string("Malformed confusables table: ") + ex.what());
    }

    auto wrapped = root.find("confusables");
    const nlohmann::json& table = (root.is_object() && wrapped != root.end()) ? *wrapped : root;
    if (!table.is_object()) {
        throw std::runtime_error("Confusables table must be a JSON object");
    }

    std::unordered_map<char32_t, std::u32string> entries;
    entries.reserve(table.size());
    for (const auto& [key, value] : table.items()) {
        if (!value.is_string()) {
            throw std::runtime_error("Confusables entry '" + key + "' is not a string");
        }
        std::u32string from = unicode::to_code_points(key);
        if (from.size() != 1) {
            throw std::runtime_error("Confusables key '" + key + "' must be exactly one character");
        }
        entries[from[0]] = unicode::to_code_points(value.get<std::string>());
    }
    return ConfusableTable(std::move(entries));
}

ConfusableTable ConfusableTable::load(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open confusables table: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return from_json(buffer.str());
}

const std::u32string* ConfusableTable::lookup(char32_t c) const {
    auto it = entries_.find(c);
    return it == entries_.end() ? nullptr : &it->second;
}

std::u32string ConfusableTable::replace(const std::u32string& input) const {
    if (entries_.empty()) {
        return input;
    }
    std::u32string result;
    result.reserve(input.size());
    for (char32_t c : input) {
        if (const std::u32string* replacement = lookup(c)) {
            result += *replacement;
        } else {
            result.push_back(c);
        }
    }
    return result;
}

} // namespace wordmatch
