#include "wordmatch/settings.h"

#include <pugixml.hpp>

#include <filesystem>
#include <stdexcept>

namespace wordmatch {

namespace {

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "TRUE" || value == "yes";
}

// Options naming files; relative values from a settings file are taken
// relative to that file
bool is_path_option(const std::string& key) {
    return key == "confusables" || key == "input" || key == "outfile";
}

void set_option(WordmatchSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;

    if (key == "confusables") settings.confusables_file = value;
    else if (key == "input") settings.input_file = value;
    else if (key == "outfile") settings.outfile = value;
    else if (key == "format") settings.format = value;
    else if (key == "pid") settings.pid = value;
    else if (key == "settings") settings.settings_file = value;
    else if (key == "markers") settings.markers = parse_flag(value);
    else if (key == "verbose") settings.verbose = parse_flag(value);
    else if (key == "debug") settings.debug = parse_flag(value);
}

// Copies the node's attributes into settings, skipping keys already set
void merge_attributes(WordmatchSettings& settings, const pugi::xml_node& node,
                      const std::filesystem::path& base_dir) {
    for (const pugi::xml_attribute& attr : node.attributes()) {
        std::string key = attr.name();
        if (settings.options.count(key) != 0) {
            continue;
        }
        std::string value = attr.value();
        if (is_path_option(key) && !value.empty() && std::filesystem::path(value).is_relative()) {
            value = (base_dir / value).lexically_normal().string();
        }
        set_option(settings, key, value);
    }
}

} // namespace

std::string WordmatchSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    return it->second;
}

int WordmatchSettings::get_int(const std::string& key, int fallback) const {
    std::string value = get(key);
    return value.empty() ? fallback : std::stoi(value);
}

bool WordmatchSettings::get_bool(const std::string& key, bool fallback) const {
    std::string value = get(key);
    return value.empty() ? fallback : parse_flag(value);
}

WordmatchSettings parse_arguments(int argc, char** argv) {
    WordmatchSettings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            continue;
        }
        std::string body = arg.substr(2);
        std::size_t eq = body.find('=');
        std::string key = body.substr(0, eq);
        std::string value = eq == std::string::npos ? "1" : body.substr(eq + 1);
        set_option(settings, key, value);
    }
    return settings;
}

WordmatchSettings load_settings(const WordmatchSettings& base) {
    const std::string path = base.settings_file.empty() ? "data/settings.xml" : base.settings_file;

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_file(path.c_str());
    if (!parsed) {
        throw std::runtime_error("Failed to load settings file " + path + ": " + parsed.description());
    }

    pugi::xml_node root = doc.child("wordmatch");
    if (!root) {
        throw std::runtime_error("Settings file " + path + " has no <wordmatch> root");
    }

    // Named parameter set, or the first one when no pid is given
    pugi::xml_node items = root.child("parameters");
    pugi::xml_node item = base.pid.empty()
        ? items.child("item")
        : items.find_child_by_attribute("item", "pid", base.pid.c_str());
    if (!item) {
        throw std::runtime_error(base.pid.empty()
            ? "No parameter set in " + path
            : "No parameter set with pid '" + base.pid + "' in " + path);
    }

    // Command line first, then the selected item, then root defaults
    WordmatchSettings combined = base;
    const std::filesystem::path base_dir = std::filesystem::path(path).parent_path();
    merge_attributes(combined, item, base_dir);
    merge_attributes(combined, root, base_dir);
    return combined;
}

} // namespace wordmatch
