#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace wordmatch {

/**
 * Immutable lookup from a single code point to its canonical replacement.
 * Characters absent from the table map to themselves. A replacement may be
 * empty or span several code points.
 */
class ConfusableTable {
public:
    ConfusableTable() = default;
    explicit ConfusableTable(std::unordered_map<char32_t, std::u32string> entries);

    // Parse a JSON object {"<char>": "<replacement>", ...}, optionally
    // wrapped as {"confusables": {...}}. Throws std::runtime_error.
    static ConfusableTable from_json(const std::string& text);

    // Read a JSON table from disk. Throws std::runtime_error.
    static ConfusableTable load(const std::string& path);

    // Returns nullptr when the character has no entry
    const std::u32string* lookup(char32_t c) const;

    std::u32string replace(const std::u32string& input) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::unordered_map<char32_t, std::u32string>& entries() const { return entries_; }

private:
    std::unordered_map<char32_t, std::u32string> entries_;
};

} // namespace wordmatch
