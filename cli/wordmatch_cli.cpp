#include "wordmatch/settings.h"
#include "wordmatch/confusables.h"
#include "wordmatch/normalizer.h"
#include "wordmatch/sentence.h"
#include "wordmatch/io_json.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>

using namespace wordmatch;

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        WordmatchSettings settings;

        if (!cli_settings.settings_file.empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        if (settings.format != "json" && settings.format != "text") {
            std::cerr << "Unknown output format: " << settings.format << " (expected json or text)" << std::endl;
            return 1;
        }

        auto table = std::make_shared<ConfusableTable>();
        if (!settings.confusables_file.empty()) {
            *table = ConfusableTable::load(settings.confusables_file);
            if (settings.verbose) {
                std::cerr << "[wordmatch] loaded " << table->size() << " confusables from "
                          << settings.confusables_file << std::endl;
            }
        } else if (settings.verbose) {
            std::cerr << "[wordmatch] no confusables table, lowercasing only" << std::endl;
        }

        Normalizer normalizer(table);
        normalizer.set_debug(settings.debug);

        std::ifstream input_file;
        if (!settings.input_file.empty()) {
            input_file.open(settings.input_file);
            if (!input_file) {
                std::cerr << "Failed to open input file: " << settings.input_file << std::endl;
                return 1;
            }
        }
        std::istream& in = settings.input_file.empty() ? std::cin : input_file;

        std::ofstream output_file;
        if (!settings.outfile.empty()) {
            output_file.open(settings.outfile);
            if (!output_file) {
                std::cerr << "Failed to open output file: " << settings.outfile << std::endl;
                return 1;
            }
        }
        std::ostream& out = settings.outfile.empty() ? std::cout : output_file;

        const int indent = settings.get_int("indent", -1);
        size_t sentence_count = 0;
        size_t char_total = 0;
        size_t word_total = 0;
        auto start = std::chrono::steady_clock::now();

        std::string line;
        while (std::getline(in, line)) {
            Sentence sentence(line, normalizer);
            if (settings.format == "text") {
                out << sentence << '\n' << boundary_codes(sentence) << '\n';
            } else {
                out << dump_sentence(sentence, settings.markers, indent) << '\n';
            }
            ++sentence_count;
            char_total += sentence.length();
            word_total += sentence.word_markers().size();
        }
        out.flush();

        if (settings.verbose) {
            float elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
            std::cerr << sentence_count << " sentences, " << char_total << " characters, "
                      << word_total << " words in " << elapsed << "s" << std::endl;
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
