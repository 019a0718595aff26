#include <gtest/gtest.h>
#include "commands/san.hpp"

using San::PieceType;

TEST(SanTest, PieceMoveWithFileDisambiguator) {
    auto info = San::parse("Rad1");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->piece, PieceType::Rook);
    EXPECT_EQ(info->destination, "d1");
    EXPECT_EQ(info->originFile, 'a');
    EXPECT_FALSE(info->originRank);
    EXPECT_FALSE(info->capture);
}

TEST(SanTest, PawnCapture) {
    auto info = San::parse("exd5");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->piece, PieceType::Pawn);
    EXPECT_EQ(info->originFile, 'e');
    EXPECT_TRUE(info->capture);
    EXPECT_EQ(info->destination, "d5");
}

TEST(SanTest, PromotionWithCheck) {
    auto info = San::parse("e8=Q+");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->promotion, PieceType::Queen);
    EXPECT_TRUE(info->check);
    EXPECT_FALSE(info->mate);
    EXPECT_EQ(info->destination, "e8");
}

TEST(SanTest, CastlingAndMate) {
    auto longCastle = San::parse("O-O-O");
    ASSERT_TRUE(longCastle);
    EXPECT_TRUE(longCastle->castleLong);
    EXPECT_EQ(longCastle->piece, PieceType::King);
    EXPECT_TRUE(longCastle->destination.empty());

    auto shortCastle = San::parse("0-0+");
    ASSERT_TRUE(shortCastle);
    EXPECT_TRUE(shortCastle->castleShort);
    EXPECT_TRUE(shortCastle->check);

    auto mate = San::parse("Qxf7#");
    ASSERT_TRUE(mate);
    EXPECT_TRUE(mate->mate);
    EXPECT_TRUE(mate->capture);
}

TEST(SanTest, RejectsGarbage) {
    EXPECT_FALSE(San::parse(""));
    EXPECT_FALSE(San::parse("Z9"));
    EXPECT_FALSE(San::parse("knight"));
}

TEST(SanTest, Canonical) {
    EXPECT_EQ(San::canonical("Nxf3+"), "nf3");
    EXPECT_EQ(San::canonical("e8=Q"), "e8q");
    EXPECT_EQ(San::canonical("Rad1"), "rad1");
}

TEST(SanTest, PieceWords) {
    EXPECT_EQ(San::pieceName(PieceType::Knight), "Knight");
    EXPECT_EQ(San::pieceWord(PieceType::Bishop), "bishop");
    EXPECT_EQ(San::pieceFromLetter('n'), PieceType::Knight);
    EXPECT_EQ(San::pieceFromLetter('P'), PieceType::Pawn);
    EXPECT_FALSE(San::pieceFromLetter('x'));
    EXPECT_EQ(San::pieceFromWord("queen"), PieceType::Queen);
    EXPECT_FALSE(San::pieceFromWord("queens"));
}

TEST(SanTest, SpokenPieceAliases) {
    EXPECT_EQ(San::pieceFromSpoken("castles"), PieceType::Rook);
    EXPECT_EQ(San::pieceFromSpoken("knights"), PieceType::Knight);
    EXPECT_EQ(San::pieceFromSpoken("pawn"), PieceType::Pawn);
    EXPECT_FALSE(San::pieceFromSpoken("bananas"));
}

TEST(SanTest, PieceValues) {
    EXPECT_EQ(San::pieceValue(PieceType::Pawn), 1);
    EXPECT_EQ(San::pieceValue(PieceType::Bishop), 3);
    EXPECT_EQ(San::pieceValue(PieceType::Queen), 9);
    EXPECT_EQ(San::pieceValue(PieceType::King), 0);
}
