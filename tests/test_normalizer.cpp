// =============================================================================
// Confusable table and Normalizer tests
// =============================================================================

#include <gtest/gtest.h>
#include "wordmatch/confusables.h"
#include "wordmatch/normalizer.h"
#include "wordmatch/unicode_utils.h"

#include <cstdint>
#include <iomanip>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace wordmatch;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<const ConfusableTable> sample_table() {
    static const auto table =
        std::make_shared<const ConfusableTable>(ConfusableTable::load(WORDMATCH_DATA_DIR "/confusables.json"));
    return table;
}

} // namespace

TEST(ConfusableTableTest, EmptyTableIsIdentity) {
    ConfusableTable table;
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.lookup(U'a'), nullptr);
    EXPECT_EQ(table.replace(U"Hello"), U"Hello");
}

TEST(ConfusableTableTest, FromJson) {
    ConfusableTable table = ConfusableTable::from_json(R"({"ß": "ss", "а": "a", "x": ""})");
    EXPECT_EQ(table.size(), 3u);
    ASSERT_NE(table.lookup(U'а'), nullptr);
    EXPECT_EQ(*table.lookup(U'а'), U"a");
    // One-to-many and one-to-none
    EXPECT_EQ(table.replace(U"straße"), U"strasse");
    EXPECT_EQ(table.replace(U"xаx"), U"a");
}

TEST(ConfusableTableTest, FromWrappedJson) {
    ConfusableTable table = ConfusableTable::from_json(R"({"confusables": {"𝕙": "h"}})");
    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.replace(U"𝕙i"), U"hi");
}

TEST(ConfusableTableTest, RejectsMalformedInput) {
    EXPECT_THROW(ConfusableTable::from_json("{not json"), std::runtime_error);
    EXPECT_THROW(ConfusableTable::from_json("[1, 2]"), std::runtime_error);
    EXPECT_THROW(ConfusableTable::from_json(R"({"a": 1})"), std::runtime_error);
    EXPECT_THROW(ConfusableTable::from_json(R"({"ab": "c"})"), std::runtime_error);
    EXPECT_THROW(ConfusableTable::from_json(R"({"": "c"})"), std::runtime_error);
}

TEST(ConfusableTableTest, LoadMissingFile) {
    EXPECT_THROW(ConfusableTable::load("/nonexistent/confusables.json"), std::runtime_error);
}

TEST(ConfusableTableTest, LoadFromDisk) {
    fs::path path = fs::temp_directory_path() / "wordmatch_test_confusables.json";
    {
        std::ofstream out(path);
        out << R"({"ⓐ": "a"})";
    }
    ConfusableTable table = ConfusableTable::load(path.string());
    fs::remove(path);
    EXPECT_EQ(table.replace(U"ⓐⓑ"), U"aⓑ");
}

TEST(ConfusableTableTest, SampleTableIsIdempotent) {
    auto table = sample_table();
    ASSERT_FALSE(table->empty());
    const std::u32string input = U"𝕙ȩ𝕀𝓁ṓ ẁọʳ𝓘ď 𝔥⒠𝚕Ӏő ὦ𝟶ɼıᑱ";
    std::u32string once = table->replace(input);
    EXPECT_EQ(table->replace(once), once);
}

TEST(NormalizerTest, DefaultOnlyLowercases) {
    Normalizer normalizer;
    EXPECT_EQ(normalizer.normalize("Steve Drowned"), "steve drowned");
    EXPECT_EQ(normalizer.normalize(""), "");
    EXPECT_EQ(normalizer.normalize("ÀÉÎ"), "àéî");
}

TEST(NormalizerTest, NullTableFallsBackToIdentity) {
    Normalizer normalizer(nullptr);
    EXPECT_TRUE(normalizer.table().empty());
    EXPECT_EQ(normalizer.normalize("ABC"), "abc");
}

TEST(NormalizerTest, SubstitutesBeforeLowercasing) {
    // Cyrillic palochka lowercases to U+04CF unless replaced first
    auto table = std::make_shared<const ConfusableTable>(ConfusableTable::from_json(R"({"Ӏ": "l"})"));
    Normalizer normalizer(table);
    EXPECT_EQ(normalizer.normalize("HEӀӀO"), "hello");
    EXPECT_EQ(Normalizer().normalize("Ӏ"), "ӏ");
}

TEST(NormalizerTest, ReplacementIsLowercasedToo) {
    auto table = std::make_shared<const ConfusableTable>(ConfusableTable::from_json(R"({"Æ": "AE"})"));
    Normalizer normalizer(table);
    EXPECT_EQ(normalizer.normalize("Æther"), "aether");
}

TEST(NormalizerTest, HomoglyphSentences) {
    Normalizer normalizer(sample_table());
    EXPECT_EQ(normalizer.normalize("hello world"), "hello world");
    EXPECT_EQ(normalizer.normalize("𝕙ȩ𝕀𝓁ṓ ẁọʳ𝓘ď"), "hello world");
    EXPECT_EQ(normalizer.normalize("𝔥⒠𝚕Ӏő ὦ𝟶ɼıᑱ"), "hello world");
}

TEST(NormalizerTest, FinalSigma) {
    Normalizer normalizer;
    EXPECT_EQ(normalizer.normalize("ΟΔΟΣ"), "οδος");
}

TEST(NormalizerTest, InvalidUtf8IsReplaced) {
    Normalizer normalizer;
    EXPECT_EQ(normalizer.normalize(std::string("A\xFF") + "B"), "a\xEF\xBF\xBD" "b");
}

TEST(NormalizerTest, IdempotentOnNormalizedText) {
    Normalizer normalizer(sample_table());
    for (const std::string input : {"Steve drowned", "𝕙ȩ𝕀𝓁ṓ ẁọʳ𝓘ď", "  MiXeD\tCase  ", ""}) {
        std::string once = normalizer.normalize(input);
        EXPECT_EQ(normalizer.normalize(once), once) << input;
    }
}

TEST(NormalizerTest, NormalizeCharsMatchesNormalize) {
    Normalizer normalizer(sample_table());
    std::u32string chars = normalizer.normalize_chars("𝕙ȩ𝕀𝓁ṓ");
    EXPECT_EQ(chars, U"hello");
}

// Lowercasing runs after substitution, so the table must already cover the
// uppercase forms of its keys
TEST(NormalizerTest, SampleTableIsStableForEveryCodePoint) {
    Normalizer normalizer(sample_table());
    std::ostringstream unstable;
    size_t count = 0;
    for (uint32_t cp = 0; cp <= 0x10FFFF; ++cp) {
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            continue;
        }
        std::string input = unicode::from_code_points(std::u32string(1, static_cast<char32_t>(cp)));
        std::string once = normalizer.normalize(input);
        if (normalizer.normalize(once) != once) {
            if (count++ < 20) {
                unstable << " U+" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << cp;
            }
        }
    }
    EXPECT_EQ(count, 0u) << "unstable:" << unstable.str();
}
