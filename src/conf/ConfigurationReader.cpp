//
// ConfigurationReader.cpp
//
#include "ConfigurationReader.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <utility>

#include "codec.hpp"
#include "../core/Exception.hpp"

namespace
{
    constexpr std::string_view BoardType = "board";
    constexpr std::string_view RulesType = "rules";

    auto ReadFile(std::filesystem::path const& path) -> std::optional<std::string>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) return std::nullopt;
        return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    }

    inline auto AsBytes(std::vector<std::uint8_t> const& v) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(v.data()), v.size()};
    }
}

namespace nikoli::core::conf
{
    ConfigurationReader::ConfigurationReader(std::filesystem::path base_dir) :
        base_dir_(std::move(base_dir))
    {
    }

    auto ConfigurationReader::ConfigurationPath(std::string_view game, std::string_view type,
                                                std::string_view ext) const -> std::filesystem::path
    {
        return base_dir_ / std::filesystem::path{game} / std::format("{}-{}{}", game, type, ext);
    }

    auto ConfigurationReader::ReadGameBoardConfiguration(std::string_view game) const -> GameBoard
    {
        std::expected<std::vector<std::uint8_t>, ParseError> bytes{};

        std::filesystem::path const json_path = ConfigurationPath(game, BoardType, ".json");
        std::filesystem::path const bin_path = ConfigurationPath(game, BoardType, ".bin");
        if (std::optional<std::string> text = ReadFile(json_path))
        {
            bytes = JsonToBinary(*text, Document::Board);
        }
        else if (std::optional<std::string> raw = ReadFile(bin_path))
        {
            bytes = std::vector<std::uint8_t>(raw->begin(), raw->end());
        }
        else
        {
            NKL_THROW(error::Code::ConfigurationNotFound,
                      std::format("No board configuration for game '{}' ({})", game, json_path.string()));
        }

        if (!bytes)
        {
            NKL_THROW(error::Code::Configuration,
                      std::format("Board configuration for '{}' is invalid: {}", game, bytes.error().message));
        }

        std::expected<GameBoard, ParseError> board = [&]
        {
            try
            {
                return DecodeBoard(AsBytes(*bytes));
            }
            catch (error::BoardError const& e)
            {
                NKL_THROW(error::Code::Configuration,
                          std::format("Board configuration for '{}' is malformed: {}", game, e.what()));
            }
        }();

        if (!board)
        {
            NKL_THROW(error::Code::Configuration,
                      std::format("Board configuration for '{}' is invalid: {}", game, board.error().message));
        }
        return std::move(*board);
    }

    auto ConfigurationReader::ReadGameRulesConfiguration(std::string_view game) const -> GameRules
    {
        std::filesystem::path const path = ConfigurationPath(game, RulesType, ".json");
        std::optional<std::string> text = ReadFile(path);
        if (!text)
        {
            NKL_THROW(error::Code::ConfigurationNotFound,
                      std::format("No rules configuration for game '{}' ({})", game, path.string()));
        }

        auto const bytes = JsonToBinary(*text, Document::Rules);
        if (!bytes)
        {
            NKL_THROW(error::Code::Configuration,
                      std::format("Rules configuration for '{}' is invalid: {}", game, bytes.error().message));
        }

        std::expected<GameRules, ParseError> rules = DecodeRules(AsBytes(*bytes));
        if (!rules)
        {
            NKL_THROW(error::Code::Configuration,
                      std::format("Rules configuration for '{}' is invalid: {}", game, rules.error().message));
        }
        if (rules->game_name.empty())
        {
            rules->game_name = std::string{game};
        }
        return std::move(*rules);
    }

    auto ConfigurationReader::ReadGame(std::string_view game) const -> PuzzleGame
    {
        GameBoard board = ReadGameBoardConfiguration(game);
        GameRules rules = ReadGameRulesConfiguration(game);
        return PuzzleGame{std::move(board), std::move(rules)};
    }
}
