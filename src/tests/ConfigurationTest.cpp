#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

#include "../conf/codec.hpp"
#include "../conf/ConfigurationReader.hpp"
#include "../core/Exception.hpp"
#include "../core/RuleFactory.hpp"
#include "Fixtures.hpp"

using namespace nikoli::core;
using nikoli::core::conf::ConfigurationReader;
using nikoli::test::P;

namespace
{
    namespace fs = std::filesystem;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    constexpr std::string_view RowRulesJson = R"({ "game": "g", "rules": ["SumRowRule"] })";

    // 4\  .  .
    constexpr std::string_view RowBoardJson = R"({
        "game": "g",
        "rows": [ { "cells": [
            { "row": 0, "column": 0, "border": true, "row_sum": 4 },
            { "row": 0, "column": 1 },
            { "row": 0, "column": 2 }
        ] } ]
    })";

    class ConfigDir : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            root_ = fs::path{"_artifacts"} / std::format("conf_{}",
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
            fs::remove_all(root_);
            fs::create_directories(root_ / "g");
        }

        void Write(std::string_view file, std::string_view text) const
        {
            std::ofstream out(root_ / "g" / file, std::ios::binary);
            out.write(text.data(), static_cast<std::streamsize>(text.size()));
        }

        auto Reader() const -> ConfigurationReader { return ConfigurationReader{root_}; }

        fs::path root_;
    };
}

TEST(RuleFactory, BuildsKnownRules)
{
    RuleUP const row = MakeRuleByName("SumRowRule");
    RuleUP const col = MakeRuleByName("SumColumnRule");
    EXPECT_EQ(row->Name(), "SumRowRule");
    EXPECT_EQ(col->Name(), "SumColumnRule");

    std::array<std::string, 2> const names{"SumColumnRule", "SumRowRule"};
    GameRules const rules = MakeGameRules("kakuro", names);
    EXPECT_EQ(rules.game_name, "kakuro");
    ASSERT_EQ(rules.rules.size(), 2u);
    EXPECT_EQ(rules.rules[0]->Name(), "SumColumnRule");
}

TEST(RuleFactory, UnknownNameThrows)
{
    try
    {
        (void)MakeRuleByName("SumDiagonalRule");
        FAIL() << "expected UnknownRuleError";
    }
    catch (error::UnknownRuleError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::UnknownRule);
        EXPECT_NE(e.what().find("SumDiagonalRule"), std::string::npos);
    }
}

TEST(Configuration, ReadsSampleKakuro)
{
    ConfigurationReader const reader{NKL_SAMPLE_CONFIG_DIR};

    EXPECT_EQ(reader.ConfigurationPath("kakuro", "board", ".json"),
              fs::path{NKL_SAMPLE_CONFIG_DIR} / "kakuro" / "kakuro-board.json");

    PuzzleGame g = reader.ReadGame("kakuro");
    EXPECT_EQ(g.Name(), "kakuro");
    EXPECT_EQ(g.Board().Rows(), 3u);
    EXPECT_EQ(g.Board().Columns(), 3u);
    ASSERT_EQ(g.Rules().size(), 2u);
    EXPECT_EQ(g.Rules()[0]->Name(), "SumRowRule");
    EXPECT_EQ(g.Rules()[1]->Name(), "SumColumnRule");

    EXPECT_TRUE(g.Board().GetCell(P(0, 1)).IsBorder());
    EXPECT_EQ(g.Board().GetCell(P(0, 1)).ColumnSum(), 4);
    EXPECT_EQ(g.Board().GetCell(P(2, 0)).RowSum(), 7);
    EXPECT_FALSE(g.Board().GetCell(P(1, 1)).IsBorder());

    EXPECT_EQ(g.Play(Move{P(1, 1), 1}), MoveOutcome::Broken);
    EXPECT_EQ(g.Play(Move{P(1, 2), 2}), MoveOutcome::Broken);
    EXPECT_EQ(g.Play(Move{P(2, 1), 3}), MoveOutcome::Broken);
    EXPECT_EQ(g.Play(Move{P(2, 2), 4}), MoveOutcome::Solved);
}

TEST(Configuration, MissingGameIsNotFound)
{
    ConfigurationReader const reader{NKL_SAMPLE_CONFIG_DIR};
    EXPECT_THROW((void)reader.ReadGameBoardConfiguration("sudoku"), error::ConfigurationNotFoundError);
    EXPECT_THROW((void)reader.ReadGameRulesConfiguration("sudoku"), error::ConfigurationNotFoundError);
}

TEST_F(ConfigDir, MinimalRowGame)
{
    Write("g-board.json", RowBoardJson);
    Write("g-rules.json", RowRulesJson);

    PuzzleGame g = Reader().ReadGame("g");
    EXPECT_EQ(g.Board().Columns(), 3u);
    EXPECT_TRUE(g.Check(Move{P(0, 1), 4}).has_value());
    EXPECT_EQ(g.Play(Move{P(0, 1), 1}), MoveOutcome::Broken);
    EXPECT_EQ(g.Play(Move{P(0, 2), 3}), MoveOutcome::Solved);
}

TEST_F(ConfigDir, RulesWithoutGameNameTakeDirectoryName)
{
    Write("g-rules.json", R"({ "rules": ["SumColumnRule"] })");

    GameRules const rules = Reader().ReadGameRulesConfiguration("g");
    EXPECT_EQ(rules.game_name, "g");
    ASSERT_EQ(rules.rules.size(), 1u);
}

TEST_F(ConfigDir, MalformedJsonIsConfigurationError)
{
    Write("g-board.json", R"({ "rows": [ { "cells": [ )");
    Write("g-rules.json", R"({ "rules": "SumRowRule" })");

    EXPECT_THROW((void)Reader().ReadGameBoardConfiguration("g"), error::ConfigurationError);
    EXPECT_THROW((void)Reader().ReadGameRulesConfiguration("g"), error::ConfigurationError);
}

TEST_F(ConfigDir, UnknownFieldIsConfigurationError)
{
    Write("g-rules.json", R"({ "rules": ["SumRowRule"], "variant": 2 })");
    EXPECT_THROW((void)Reader().ReadGameRulesConfiguration("g"), error::ConfigurationError);
}

TEST_F(ConfigDir, UnknownRuleNameIsReported)
{
    Write("g-rules.json", R"({ "rules": ["SumRowRule", "NoRepeatRule"] })");
    EXPECT_THROW((void)Reader().ReadGameRulesConfiguration("g"), error::UnknownRuleError);
}

TEST_F(ConfigDir, EmptyBoardIsConfigurationError)
{
    Write("g-board.json", R"({ "game": "g", "rows": [] })");
    EXPECT_THROW((void)Reader().ReadGameBoardConfiguration("g"), error::ConfigurationError);
}

TEST_F(ConfigDir, JaggedBoardIsConfigurationError)
{
    Write("g-board.json", R"({ "rows": [
        { "cells": [ { "row": 0, "column": 0, "border": true, "row_sum": 1 }, { "row": 0, "column": 1 } ] },
        { "cells": [ { "row": 1, "column": 0, "border": true } ] }
    ] })");
    EXPECT_THROW((void)Reader().ReadGameBoardConfiguration("g"), error::ConfigurationError);
}

TEST_F(ConfigDir, PlayableCellWithoutClueIsRejectedOnLoad)
{
    // .  4\  .
    Write("g-board.json", R"({ "rows": [ { "cells": [
        { "row": 0, "column": 0 },
        { "row": 0, "column": 1, "border": true, "row_sum": 4 },
        { "row": 0, "column": 2 }
    ] } ] })");
    Write("g-rules.json", RowRulesJson);

    EXPECT_NO_THROW((void)Reader().ReadGameBoardConfiguration("g"));
    EXPECT_THROW((void)Reader().ReadGame("g"), error::ConfigurationError);
}

TEST_F(ConfigDir, FallsBackToCompiledBoard)
{
    GameBoard const source = nikoli::test::Kakuro3x3(1, 0, 0, 4);
    flatbuffers::DetachedBuffer const buf = conf::EncodeBoard(source, "g");
    Write("g-board.bin", std::string_view{reinterpret_cast<char const*>(buf.data()), buf.size()});

    GameBoard const b = Reader().ReadGameBoardConfiguration("g");
    EXPECT_EQ(b.Rows(), 3u);
    EXPECT_EQ(b.GetCell(P(1, 1)).Value(), 1);
    EXPECT_EQ(b.GetCell(P(2, 2)).Value(), 4);
    EXPECT_EQ(b.GetCell(P(0, 2)).ColumnSum(), 6);
    EXPECT_EQ(b.GetCell(P(2, 0)).RowSum(), 7);
}

TEST_F(ConfigDir, CorruptCompiledBoardIsConfigurationError)
{
    Write("g-board.bin", "not a flatbuffer at all");
    EXPECT_THROW((void)Reader().ReadGameBoardConfiguration("g"), error::ConfigurationError);
}

TEST(Codec, DecodeRejectsGarbage)
{
    std::array<std::byte, 3> const tiny{std::byte{1}, std::byte{2}, std::byte{3}};
    auto const board = conf::DecodeBoard(tiny);
    ASSERT_FALSE(board.has_value());
    EXPECT_FALSE(board.error().message.empty());

    auto const rules = conf::DecodeRules(tiny);
    EXPECT_FALSE(rules.has_value());
}

TEST(Codec, RulesKeepOrderAndName)
{
    flatbuffers::DetachedBuffer const buf = conf::EncodeRules(nikoli::test::SumRules());

    auto const rules = conf::DecodeRules(AsBytes(buf));
    ASSERT_TRUE(rules.has_value()) << rules.error().message;
    EXPECT_EQ(rules->game_name, "kakuro");
    ASSERT_EQ(rules->rules.size(), 2u);
    EXPECT_EQ(rules->rules[0]->Name(), "SumRowRule");
    EXPECT_EQ(rules->rules[1]->Name(), "SumColumnRule");
}

TEST(Codec, JsonNeedsKnownRootTable)
{
    auto const ok = conf::JsonToBinary(R"({ "rules": [] })", conf::Document::Rules);
    EXPECT_TRUE(ok.has_value());

    auto const bad = conf::JsonToBinary("[1, 2, 3]", conf::Document::Board);
    EXPECT_FALSE(bad.has_value());
}
