#pragma once

#include "confusables.h"

#include <memory>
#include <string>

namespace wordmatch {

class Normalizer {
public:
    // Identity substitution, lowercasing only
    Normalizer();

    explicit Normalizer(std::shared_ptr<const ConfusableTable> table);

    // Set debug flag for verbose output
    void set_debug(bool debug) { debug_ = debug; }

    // Replace confusables, then lowercase. Never fails.
    std::u32string normalize_chars(const std::string& raw) const;
    std::string normalize(const std::string& raw) const;

    const ConfusableTable& table() const { return *table_; }

private:
    std::shared_ptr<const ConfusableTable> table_;
    bool debug_ = false;

    std::u32string substitute(const std::u32string& input) const;
};

} // namespace wordmatch
