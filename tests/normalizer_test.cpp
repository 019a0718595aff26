#include <gtest/gtest.h>
#include "bootstrap_config.hpp"
#include "phonetics/normalizer.hpp"
#include "phonetics/vocabulary.hpp"

#include <string>
#include <vector>

using Phonetics::TokenSequence;

class NormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string err;
        ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary(), &err)) << err;
    }

    TokenSequence norm(const std::string& raw) const {
        return Phonetics::normalize(raw, vocab);
    }

    Phonetics::Vocabulary vocab;
};

TEST_F(NormalizerTest, SpelledFileAndRankBecomeCoordinates) {
    EXPECT_EQ(norm("Knight to F three"), (TokenSequence{"knight", "to", "f", "3"}));
    EXPECT_EQ(norm("alpha one"), (TokenSequence{"a", "1"}));
    EXPECT_EQ(norm("sea three"), (TokenSequence{"c", "3"}));
}

TEST_F(NormalizerTest, PieceHomophonesAndNatoFiles) {
    EXPECT_EQ(norm("Night takes echo five"), (TokenSequence{"knight", "takes", "e", "5"}));
    EXPECT_EQ(norm("rocks delta one"), (TokenSequence{"rook", "d", "1"}));
}

TEST_F(NormalizerTest, ForIsARankOnlyAfterAFile) {
    EXPECT_EQ(norm("e for"), (TokenSequence{"e", "4"}));
    EXPECT_EQ(norm("legal moves for bishop"),
              (TokenSequence{"legal", "moves", "for", "bishop"}));
}

TEST_F(NormalizerTest, CompoundCorrectionsRunFirst) {
    EXPECT_EQ(norm("Rookie four"), (TokenSequence{"rook", "e", "4"}));
    EXPECT_EQ(norm("bishop before"), (TokenSequence{"bishop", "b", "4"}));
    EXPECT_EQ(norm("bishop takes he 5"), (TokenSequence{"bishop", "takes", "e", "5"}));
    EXPECT_EQ(norm("the 4"), (TokenSequence{"d", "4"}));
}

TEST_F(NormalizerTest, CastlingShorthand) {
    EXPECT_EQ(norm("O-O-O"), (TokenSequence{"castle", "queenside"}));
    EXPECT_EQ(norm("O-O"), (TokenSequence{"castle", "kingside"}));
    EXPECT_EQ(norm("Castles king side"), (TokenSequence{"castle", "kingside"}));
}

TEST_F(NormalizerTest, PunctuationAndApostrophes) {
    EXPECT_EQ(norm("Knight, f3!"), (TokenSequence{"knight", "f3"}));
    EXPECT_EQ(norm("What\xE2\x80\x99s on e4?"), (TokenSequence{"what's", "on", "e4"}));
}

TEST_F(NormalizerTest, NormalizedTextNormalizesToItself) {
    const std::vector<std::string> inputs = {
        "rookie four", "castles king side", "the four", "what's on he ate",
        "O-O-O", "bishop before", "the one on the eighth", "Night takes echo five",
        "sea for", "knight g1 to f3", "legal moves for bishop", "e takes d5"
    };
    for (const auto& raw : inputs) {
        TokenSequence once = norm(raw);
        EXPECT_EQ(norm(Phonetics::joinTokens(once)), once) << raw;
    }
}

TEST_F(NormalizerTest, EmptyAndBlankInput) {
    EXPECT_TRUE(norm("").empty());
    EXPECT_TRUE(norm("  ...  ").empty());
}

TEST(NormalizerHelpers, PrepareTranscriptCollapsesWhitespace) {
    EXPECT_EQ(Phonetics::prepareTranscript("  Rook   TO d1 "), "rook to d1");
}

TEST(NormalizerHelpers, TokenClassification) {
    EXPECT_TRUE(Phonetics::isFileToken("a"));
    EXPECT_TRUE(Phonetics::isFileToken("h"));
    EXPECT_FALSE(Phonetics::isFileToken("i"));
    EXPECT_TRUE(Phonetics::isRankToken("8"));
    EXPECT_FALSE(Phonetics::isRankToken("9"));
    EXPECT_TRUE(Phonetics::isSquareToken("e4"));
    EXPECT_FALSE(Phonetics::isSquareToken("e9"));
    EXPECT_FALSE(Phonetics::isSquareToken("e44"));
}

TEST(NormalizerHelpers, SplitAndJoin) {
    TokenSequence tokens = Phonetics::splitTokens("rook  d 1");
    EXPECT_EQ(tokens, (TokenSequence{"rook", "d", "1"}));
    EXPECT_EQ(Phonetics::joinTokens(tokens), "rook d 1");
    EXPECT_EQ(Phonetics::joinTokens(tokens, ""), "rookd1");
}
