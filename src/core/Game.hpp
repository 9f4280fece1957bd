//
// Game.hpp
//

#ifndef NIKOLI_GAME_HPP
#define NIKOLI_GAME_HPP

#include <string_view>
#include <vector>
#include "Board.hpp"
#include "Exception.hpp"
#include "Rules.hpp"
#include "Types.hpp"

namespace nikoli::core
{
    // Owns a loaded board and its rules. Const members only read, so they may be
    // called concurrently as long as no thread is inside Play().
    class PuzzleGame
    {
    public:
        using CheckResult = error::ValidateResult;

        PuzzleGame() = delete;
        // Runs every rule's CheckBoard; throws error::ConfigurationError on a board a rule cannot walk.
        PuzzleGame(GameBoard board, GameRules rules);

        // Speculative: the board is not touched. First violation wins.
        auto Check(Move const& m) const -> CheckResult;
        auto Violations(Move const& m) const -> std::vector<error::RuleViolation>;

        // Target check, then the rules at the target, then the write.
        auto Play(Move const& m) -> MoveOutcome;

        auto IsSolved() const -> bool;

        auto Board() const noexcept -> GameBoard const& { return board_; }
        auto Rules() const noexcept -> std::vector<RuleUP> const& { return rules_.rules; }
        auto Name() const noexcept -> std::string_view { return rules_.game_name; }

    private:
        auto CheckTarget(Move const& m) const -> CheckResult;

    private:
        GameBoard board_;
        GameRules rules_;
    };
}
#endif //NIKOLI_GAME_HPP
