#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "bootstrap_config.hpp"
#include "commands/command_grammar.hpp"

class CommandGrammarTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string err;
        ASSERT_TRUE(grammar.load_rules_from_json(bootstrap_config::defaultCommandRules()["rules"], &err)) << err;
    }

    std::optional<QueryCommand> query(const std::string& text, const std::string& context = CONTEXT_GAME) {
        auto cmd = grammar.match(text, context);
        if (!cmd) return std::nullopt;
        if (const auto* q = std::get_if<QueryCommand>(&*cmd)) return *q;
        return std::nullopt;
    }

    std::optional<MetaCommand> meta(const std::string& text, const std::string& context) {
        auto cmd = grammar.match(text, context);
        if (!cmd) return std::nullopt;
        if (const auto* m = std::get_if<MetaCommand>(&*cmd)) return *m;
        return std::nullopt;
    }

    CommandGrammar grammar;
};

TEST_F(CommandGrammarTest, AllDefaultRulesCompile) {
    EXPECT_EQ(grammar.rule_count(), bootstrap_config::defaultCommandRules()["rules"].size());
}

TEST_F(CommandGrammarTest, SquareContents) {
    auto q = query("what is on e4");
    ASSERT_TRUE(q);
    EXPECT_EQ(q->kind, QueryKind::SquareContents);
    EXPECT_EQ(q->square, "e4");

    auto spaced = query("what's on d 5");
    ASSERT_TRUE(spaced);
    EXPECT_EQ(spaced->square, "d5");
}

TEST_F(CommandGrammarTest, PieceQueries) {
    auto where = query("where are my knight");
    ASSERT_TRUE(where);
    EXPECT_EQ(where->kind, QueryKind::PieceLocation);
    EXPECT_EQ(where->piece, San::PieceType::Knight);

    auto legal = query("legal moves for my bishop");
    ASSERT_TRUE(legal);
    EXPECT_EQ(legal->kind, QueryKind::LegalMovesFor);
    EXPECT_EQ(legal->piece, San::PieceType::Bishop);
}

TEST_F(CommandGrammarTest, UnconvertibleSlotFallsThrough) {
    EXPECT_FALSE(grammar.match("where is the banana", CONTEXT_GAME));
}

TEST_F(CommandGrammarTest, SimpleQueries) {
    EXPECT_EQ(query("how much time do i have")->kind, QueryKind::ClockRemaining);
    EXPECT_EQ(query("what was the last move")->kind, QueryKind::LastMove);
    EXPECT_EQ(query("who is ahead")->kind, QueryKind::MaterialBalance);
    EXPECT_EQ(query("how am i doing")->kind, QueryKind::Evaluation);
}

TEST_F(CommandGrammarTest, RulesOnlyFireInTheirContext) {
    EXPECT_FALSE(grammar.match("what is on e4", CONTEXT_RECONSTRUCTION));
    EXPECT_FALSE(grammar.match("resign", CONTEXT_TRAINING));
    EXPECT_FALSE(grammar.match("yes", CONTEXT_GAME));

    auto yes = meta("yes", CONTEXT_GAME_CONFIRM);
    ASSERT_TRUE(yes);
    EXPECT_EQ(yes->kind, MetaKind::ConfirmYes);

    auto no = meta("no", CONTEXT_GAME_CONFIRM);
    ASSERT_TRUE(no);
    EXPECT_EQ(no->kind, MetaKind::ConfirmNo);
}

TEST_F(CommandGrammarTest, GameMeta) {
    EXPECT_EQ(meta("i resign", CONTEXT_GAME)->kind, MetaKind::Resign);
    EXPECT_EQ(meta("peek", CONTEXT_GAME)->kind, MetaKind::Peek);
    EXPECT_EQ(meta("say again", CONTEXT_GAME)->kind, MetaKind::Repeat);
    EXPECT_EQ(meta("repeat", CONTEXT_TRAINING)->kind, MetaKind::Repeat);

    // Peek is whole-utterance only
    EXPECT_FALSE(grammar.match("show me what you have", CONTEXT_GAME));
}

TEST_F(CommandGrammarTest, ReconstructionPlacement) {
    auto placed = meta("white knight on f 3", CONTEXT_RECONSTRUCTION);
    ASSERT_TRUE(placed);
    EXPECT_EQ(placed->kind, MetaKind::PlacePiece);
    EXPECT_EQ(placed->piece, San::PieceType::Knight);
    EXPECT_EQ(placed->square, "f3");
    EXPECT_EQ(placed->color, "white");

    auto bare = meta("rook a1", CONTEXT_RECONSTRUCTION);
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->kind, MetaKind::PlacePiece);
    EXPECT_EQ(bare->square, "a1");
    EXPECT_TRUE(bare->color.empty());
}

TEST_F(CommandGrammarTest, ReconstructionEditing) {
    auto removed = meta("remove e4", CONTEXT_RECONSTRUCTION);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->kind, MetaKind::RemovePiece);
    EXPECT_EQ(removed->square, "e4");

    EXPECT_EQ(meta("clear board", CONTEXT_RECONSTRUCTION)->kind, MetaKind::ClearBoard);
    EXPECT_EQ(meta("done", CONTEXT_RECONSTRUCTION)->kind, MetaKind::Submit);

    auto color = meta("switch to black", CONTEXT_RECONSTRUCTION);
    ASSERT_TRUE(color);
    EXPECT_EQ(color->kind, MetaKind::SwitchColor);
    EXPECT_EQ(color->color, "black");
}

TEST(CommandGrammarLoading, UnknownIntentAndBadRegexAreSkipped) {
    CommandGrammar grammar;
    std::string err;
    ASSERT_TRUE(grammar.load_rules_from_string(R"([
        {"intent": "meta.dance", "pattern": "dance"},
        {"intent": "meta.resign", "pattern": "(broken"},
        {"intent": "meta.resign", "pattern": "give up"}
    ])", &err)) << err;
    EXPECT_EQ(grammar.rule_count(), 1u);

    // Rules without "contexts" are game rules
    auto cmd = grammar.match("i give up", CONTEXT_GAME);
    ASSERT_TRUE(cmd);
    EXPECT_EQ(std::get<MetaCommand>(*cmd).kind, MetaKind::Resign);
}

TEST(CommandGrammarLoading, RejectsNonArray) {
    CommandGrammar grammar;
    std::string err;
    EXPECT_FALSE(grammar.load_rules_from_string(R"({"rules": []})", &err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(grammar.load_rules_from_string("not json", &err));
}

TEST(CommandGrammarLoading, CommandFromIntentSlots) {
    EXPECT_FALSE(commandFromIntent("meta.switch_color", {}));
    EXPECT_FALSE(commandFromIntent("query.square_contents", {{"file", "e"}, {"rank", "9"}}));

    auto cmd = commandFromIntent("query.square_contents", {{"square", "h8"}});
    ASSERT_TRUE(cmd);
    EXPECT_EQ(std::get<QueryCommand>(*cmd).square, "h8");

    EXPECT_TRUE(isKnownIntent("query.material"));
    EXPECT_FALSE(isKnownIntent("query.weather"));
}
