//
// ConfigurationReader.hpp
//

#ifndef NIKOLI_CONFIGURATIONREADER_HPP
#define NIKOLI_CONFIGURATIONREADER_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "../core/Board.hpp"
#include "../core/Game.hpp"
#include "../core/Rules.hpp"

namespace nikoli::core::conf
{
    // Reads <base>/<game>/<game>-board.json (or -board.bin) and <base>/<game>/<game>-rules.json.
    //
    // Throws error::ConfigurationNotFoundError when a file is missing, error::ConfigurationError
    // when it cannot be parsed or describes an unusable board, and error::UnknownRuleError for
    // rule names without an implementation.
    class ConfigurationReader
    {
    public:
        explicit ConfigurationReader(std::filesystem::path base_dir);

        auto ReadGameBoardConfiguration(std::string_view game) const -> GameBoard;
        auto ReadGameRulesConfiguration(std::string_view game) const -> GameRules;

        // Board + rules. PuzzleGame runs every rule's load-time check against the board.
        auto ReadGame(std::string_view game) const -> PuzzleGame;

        auto ConfigurationPath(std::string_view game, std::string_view type, std::string_view ext) const
            -> std::filesystem::path;

    private:
        std::filesystem::path base_dir_;
    };
}

#endif //NIKOLI_CONFIGURATIONREADER_HPP
