#include <gtest/gtest.h>
#include "bootstrap_config.hpp"
#include "commands/disambiguation.hpp"
#include "commands/move_resolver.hpp"

class MoveResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(vocab.load(bootstrap_config::defaultVocabulary()));
        ASSERT_TRUE(grammar.load_rules_from_json(bootstrap_config::defaultCommandRules()["rules"]));
    }

    ResolutionOutcome resolve(const std::string& spoken,
                              const std::vector<std::string>& legal,
                              const std::string& context = CONTEXT_GAME,
                              const DisambiguationState* pending = nullptr) const {
        MoveResolver resolver(vocab, grammar);
        return resolver.resolve(Phonetics::normalize(spoken, vocab), legal, context, pending);
    }

    static std::string movePlayed(const ResolutionOutcome& outcome) {
        const auto* resolved = std::get_if<Resolved>(&outcome);
        if (!resolved) return "<" + describeOutcome(outcome) + ">";
        const auto* move = std::get_if<MoveCommand>(&resolved->command);
        if (!move || move->candidates.size() != 1) return "<" + describeOutcome(outcome) + ">";
        return move->candidates.front();
    }

    Phonetics::Vocabulary vocab;
    CommandGrammar grammar;
};

TEST_F(MoveResolverTest, PieceAndDestination) {
    EXPECT_EQ(movePlayed(resolve("knight to f3", {"Nf3", "Nc3", "e4"})), "Nf3");
    EXPECT_EQ(movePlayed(resolve("night to eff three", {"Nf3", "Nc3", "e4"})), "Nf3");
    EXPECT_EQ(movePlayed(resolve("bishop b5", {"Bb5+", "Nf3"})), "Bb5+");
}

TEST_F(MoveResolverTest, BareCoordinateIsAPawnMove) {
    EXPECT_EQ(movePlayed(resolve("c4", {"c4", "Nf3"})), "c4");
    EXPECT_EQ(movePlayed(resolve("f3", {"Nf3", "f3"})), "f3");
    EXPECT_EQ(movePlayed(resolve("e eight", {"e8=N", "e8=B", "e8=Q", "e8=R"})), "e8=Q");
}

TEST_F(MoveResolverTest, PawnCaptureByFile) {
    EXPECT_EQ(movePlayed(resolve("e takes d5", {"exd5", "cxd5", "e5"})), "exd5");
    EXPECT_EQ(movePlayed(resolve("c takes d5", {"exd5", "cxd5", "e5"})), "cxd5");
}

TEST_F(MoveResolverTest, PawnsFromTwoFilesAreAmbiguous) {
    const std::vector<std::string> legal = {"exd5", "cxd5", "Nf3"};
    for (const std::string spoken : {"pawn takes d5", "takes d5", "d5"}) {
        auto outcome = resolve(spoken, legal);
        const auto* amb = std::get_if<Ambiguous>(&outcome);
        ASSERT_NE(amb, nullptr) << spoken << " -> " << describeOutcome(outcome);
        EXPECT_EQ(amb->piece, San::PieceType::Pawn);
        EXPECT_EQ(amb->square, "d5");
        EXPECT_EQ(amb->candidates, (std::vector<std::string>{"exd5", "cxd5"}));
    }
}

TEST_F(MoveResolverTest, CapturePromotionsCollapsePerPawn) {
    const std::vector<std::string> legal = {"exd8=Q", "exd8=N", "cxd8=Q", "cxd8=N"};

    auto outcome = resolve("d8", legal);
    const auto* amb = std::get_if<Ambiguous>(&outcome);
    ASSERT_NE(amb, nullptr) << describeOutcome(outcome);
    EXPECT_EQ(amb->candidates, (std::vector<std::string>{"exd8=Q", "cxd8=Q"}));

    outcome = resolve("pawn d8 knight", legal);
    amb = std::get_if<Ambiguous>(&outcome);
    ASSERT_NE(amb, nullptr) << describeOutcome(outcome);
    EXPECT_EQ(amb->candidates, (std::vector<std::string>{"exd8=N", "cxd8=N"}));

    EXPECT_EQ(movePlayed(resolve("c takes d8 knight", legal)), "cxd8=N");
}

TEST_F(MoveResolverTest, FollowUpPicksThePawn) {
    DisambiguationState pending;
    pending.candidates = {"exd5", "cxd5"};
    pending.piece = San::PieceType::Pawn;
    pending.square = "d5";

    const std::vector<std::string> legal = {"exd5", "cxd5", "Nf3"};
    EXPECT_EQ(movePlayed(resolve("echo", legal, CONTEXT_GAME, &pending)), "exd5");
    EXPECT_EQ(movePlayed(resolve("the one on c", legal, CONTEXT_GAME, &pending)), "cxd5");
}

TEST_F(MoveResolverTest, NotationOnlyCountsOnWordBoundaries) {
    EXPECT_EQ(movePlayed(resolve("then e5", {"Ne5", "e5"})), "e5");
    EXPECT_EQ(movePlayed(resolve("n e5", {"Ne5", "e5"})), "Ne5");
}

TEST_F(MoveResolverTest, Underpromotion) {
    const std::vector<std::string> legal = {"e8=Q", "e8=R", "e8=B", "e8=N"};
    EXPECT_EQ(movePlayed(resolve("e8 knight", legal)), "e8=N");
    EXPECT_EQ(movePlayed(resolve("e eight promote to rook", legal)), "e8=R");
}

TEST_F(MoveResolverTest, Castling) {
    const std::vector<std::string> legal = {"O-O", "O-O-O", "Kf1"};
    EXPECT_EQ(movePlayed(resolve("castle kingside", legal)), "O-O");
    EXPECT_EQ(movePlayed(resolve("castles queen side", legal)), "O-O-O");
    EXPECT_EQ(movePlayed(resolve("O-O-O", legal)), "O-O-O");
    EXPECT_EQ(movePlayed(resolve("castle", {"O-O-O", "Kd1"})), "O-O-O");
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("castle", {"e4", "Kd1"})));
}

TEST_F(MoveResolverTest, TwoRooksSameSquareIsAmbiguous) {
    auto outcome = resolve("rook d one", {"Rad1", "Rfd1", "e4"});
    const auto* amb = std::get_if<Ambiguous>(&outcome);
    ASSERT_NE(amb, nullptr) << describeOutcome(outcome);
    EXPECT_EQ(amb->piece, San::PieceType::Rook);
    EXPECT_EQ(amb->square, "d1");
    EXPECT_EQ(amb->candidates, (std::vector<std::string>{"Rad1", "Rfd1"}));
}

TEST_F(MoveResolverTest, SpokenOriginSettlesItUpFront) {
    EXPECT_EQ(movePlayed(resolve("rook a d one", {"Rad1", "Rfd1"})), "Rad1");
    EXPECT_EQ(movePlayed(resolve("knight g1 f3", {"Nf3", "Nd2"})), "Nf3");
}

TEST_F(MoveResolverTest, FollowUpNarrowsPendingCandidates) {
    DisambiguationState pending;
    pending.candidates = {"Rad1", "Rfd1"};
    pending.piece = San::PieceType::Rook;
    pending.square = "d1";

    const std::vector<std::string> legal = {"Rad1", "Rfd1", "e4"};
    EXPECT_EQ(movePlayed(resolve("a", legal, CONTEXT_GAME, &pending)), "Rad1");
    EXPECT_EQ(movePlayed(resolve("the one on f", legal, CONTEXT_GAME, &pending)), "Rfd1");

    // Homophone aliases only count during a follow-up
    EXPECT_EQ(movePlayed(resolve("if", legal, CONTEXT_GAME, &pending)), "Rfd1");
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("if", legal)));
}

TEST_F(MoveResolverTest, FollowUpByRank) {
    DisambiguationState pending;
    pending.candidates = {"R1a3", "R7a3"};
    pending.piece = San::PieceType::Rook;
    pending.square = "a3";

    EXPECT_EQ(movePlayed(resolve("seven", {"R1a3", "R7a3"}, CONTEXT_GAME, &pending)), "R7a3");
}

TEST_F(MoveResolverTest, IrrelevantFollowUpIsUnmatched) {
    DisambiguationState pending;
    pending.candidates = {"Rad1", "Rfd1"};

    EXPECT_TRUE(std::holds_alternative<Unmatched>(
        resolve("banana", {"Rad1", "Rfd1"}, CONTEXT_GAME, &pending)));
}

TEST_F(MoveResolverTest, CommandsWinOverMoves) {
    auto outcome = resolve("what is on e4", {"e4", "Nf3"});
    const auto* resolved = std::get_if<Resolved>(&outcome);
    ASSERT_NE(resolved, nullptr);
    const auto* query = std::get_if<QueryCommand>(&resolved->command);
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(query->kind, QueryKind::SquareContents);
    EXPECT_EQ(query->square, "e4");
}

TEST_F(MoveResolverTest, UnmatchedCases) {
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("banana", {"e4", "Nf3"})));
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("knight f3", {})));
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("", {"e4"})));
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("queen h5", {"e4", "Nf3"})));
    EXPECT_TRUE(std::holds_alternative<Unmatched>(resolve("resign", {}, CONTEXT_TRAINING)));
}

TEST_F(MoveResolverTest, SameInputSameOutcome) {
    const std::vector<std::string> legal = {"Rad1", "Rfd1", "Nf3"};
    EXPECT_EQ(describeOutcome(resolve("rook d1", legal)), describeOutcome(resolve("rook d1", legal)));
    EXPECT_EQ(describeOutcome(resolve("knight f3", legal)), "Resolved(Move Nf3)");
}
