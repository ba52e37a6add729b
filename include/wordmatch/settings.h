#pragma once

#include <string>
#include <unordered_map>

namespace wordmatch {

struct WordmatchSettings {
    std::unordered_map<std::string, std::string> options;
    std::string pid;
    std::string settings_file;
    std::string confusables_file;
    std::string input_file;
    std::string outfile;
    std::string format = "json";
    bool verbose = false;
    bool debug = false;
    bool markers = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;
};

WordmatchSettings parse_arguments(int argc, char** argv);
WordmatchSettings load_settings(const WordmatchSettings& base);

} // namespace wordmatch
