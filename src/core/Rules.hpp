//
// Rules.hpp
//

#ifndef NIKOLI_RULES_HPP
#define NIKOLI_RULES_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "BoardIterator.hpp"
#include "Exception.hpp"
#include "Types.hpp"

namespace nikoli::core
{
    class GameBoard;

    class Rule
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rule() = default;

        // Returns unexpected(reason) when applying the move would break the rule (NOT an exception).
        // Pure read of the iterator; throws only for out-of-bounds traversal on a malformed board.
        virtual auto Validate(BoardIterator const& it, Move const& m) const -> CheckResult = 0;

        virtual auto Name() const noexcept -> std::string_view = 0;

        // Load-time structural check of a board this rule will run on.
        // Throws error::ConfigurationError if the board cannot satisfy the rule's traversal.
        virtual auto CheckBoard(GameBoard const& board) const -> void { (void)board; }

        auto IsRuleBroken(BoardIterator const& it, Move const& m) const -> bool
        {
            return !Validate(it, m).has_value();
        }
    };

    using RuleUP = std::unique_ptr<Rule>;

    struct GameRules
    {
        std::string game_name;
        std::vector<RuleUP> rules;
    };
}

#endif //NIKOLI_RULES_HPP
