#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bootstrap_config.hpp"
#include "phonetics/vocabulary.hpp"

using nlohmann::json;

TEST(VocabularyTest, DefaultTablesLoad) {
    Phonetics::Vocabulary vocab;
    std::string err;
    ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary(), &err)) << err;
    EXPECT_GT(vocab.entry_count(), 50u);
    EXPECT_FALSE(vocab.compounds().empty());
    EXPECT_EQ(vocab.files().find("delta").value_or(""), "d");
    EXPECT_EQ(vocab.ranks().find("ate").value_or(""), "8");
    EXPECT_EQ(vocab.pieces().find("horse").value_or(""), "knight");
    EXPECT_FALSE(vocab.files().find("knight").has_value());
}

TEST(VocabularyTest, ContextRanksConnectorsFillers) {
    Phonetics::Vocabulary vocab;
    ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary()));

    EXPECT_EQ(vocab.contextRank("for").value_or(""), "4");
    EXPECT_EQ(vocab.contextRank("too").value_or(""), "2");
    EXPECT_FALSE(vocab.contextRank("four").has_value());

    EXPECT_TRUE(vocab.isConnector("takes"));
    EXPECT_TRUE(vocab.isConnector("to"));
    EXPECT_FALSE(vocab.isConnector("knight"));
    EXPECT_TRUE(vocab.isFiller("um"));
    EXPECT_TRUE(vocab.isFiller("please"));
    EXPECT_FALSE(vocab.isFiller("rook"));
}

TEST(VocabularyTest, DisambiguationAliasesAreSeparate) {
    Phonetics::Vocabulary vocab;
    ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary()));

    EXPECT_EQ(vocab.disambiguationAlias("the").value_or(""), "d");
    EXPECT_EQ(vocab.disambiguationAlias("fife").value_or(""), "5");
    EXPECT_FALSE(vocab.files().find("the").has_value());
}

TEST(VocabularyTest, LongestVariantWins) {
    json j = {
        {"pieces", {
            {"knight", json::array({"night"})},
            {"rook", json::array({"night shift"})}
        }}
    };
    Phonetics::Vocabulary vocab;
    ASSERT_TRUE(vocab.load(j));
    EXPECT_EQ(vocab.pieces().substitute("night shift to d1"), "rook to d1");
    EXPECT_EQ(vocab.pieces().substitute("night to f3"), "knight to f3");
}

TEST(VocabularyTest, WholeWordsOnly) {
    json j = { {"files", { {"c", json::array({"see"})} }} };
    Phonetics::Vocabulary vocab;
    ASSERT_TRUE(vocab.load(j));
    EXPECT_EQ(vocab.files().substitute("see seeing oversee"), "c seeing oversee");
}

TEST(VocabularyTest, RejectsNonObjectAndKeepsOldTables) {
    Phonetics::Vocabulary vocab;
    ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary()));

    std::string err;
    EXPECT_FALSE(vocab.load(json::array(), &err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(vocab.files().find("delta").value_or(""), "d");
}

TEST(VocabularyTest, RejectsBadCompoundPattern) {
    Phonetics::Vocabulary vocab;
    ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary()));

    json bad = { {"compounds", json::array({ {{"pattern", "(unclosed"}, {"replace", "x"}} })} };
    std::string err;
    EXPECT_FALSE(vocab.load(bad, &err));
    EXPECT_NE(err.find("invalid vocabulary pattern"), std::string::npos);
    EXPECT_EQ(vocab.pieces().find("night").value_or(""), "knight");
}

TEST(VocabularyTest, MissingFile) {
    Phonetics::Vocabulary vocab;
    std::string err;
    EXPECT_FALSE(vocab.load_file("/nonexistent/vocabulary.json", &err));
    EXPECT_NE(err.find("Could not open file"), std::string::npos);
}
