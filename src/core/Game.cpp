//
// Game.cpp
//
#include "Game.hpp"

#include <algorithm>
#include <utility>

namespace
{
    inline auto Viol(nikoli::core::error::RuleViolationCode code) -> nikoli::core::error::RuleViolation
    {
        return nikoli::core::error::RuleViolation{.code = code};
    }
}

namespace nikoli::core
{
    PuzzleGame::PuzzleGame(GameBoard board, GameRules rules) :
        board_(std::move(board)),
        rules_(std::move(rules))
    {
        NKL_ASSERT(std::ranges::none_of(rules_.rules, [](RuleUP const& r) { return !r; }), "Null rule in game");

        for (RuleUP const& r : rules_.rules)
        {
            r->CheckBoard(board_);
        }
    }

    auto PuzzleGame::CheckTarget(Move const& m) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        if (!board_.Contains(m.position))
            return std::unexpected(Viol(RVC::Move_OutOfBounds).with_position(m.position));

        if (board_.GetCell(m.position).IsBorder())
            return std::unexpected(Viol(RVC::Move_TargetIsClue).with_position(m.position));

        if (m.value < 0)
            return std::unexpected(Viol(RVC::Move_NegativeValue).with_position(m.position).with_actual(m.value));

        return {};
    }

    auto PuzzleGame::Check(Move const& m) const -> CheckResult
    {
        if (CheckResult t = CheckTarget(m); !t)
            return t;

        for (RuleUP const& r : rules_.rules)
        {
            CheckResult res = r->Validate(board_, m);
            if (!res) return res;
        }
        return {};
    }

    auto PuzzleGame::Violations(Move const& m) const -> std::vector<error::RuleViolation>
    {
        std::vector<error::RuleViolation> out;

        if (CheckResult t = CheckTarget(m); !t)
        {
            out.push_back(t.error());
            return out;
        }

        for (RuleUP const& r : rules_.rules)
        {
            if (CheckResult res = r->Validate(board_, m); !res)
                out.push_back(res.error());
        }
        return out;
    }

    auto PuzzleGame::Play(Move const& m) -> MoveOutcome
    {
        if (!CheckTarget(m)) return MoveOutcome::Invalid;

        // Rules see the move through a pending view; nothing is written if one throws.
        bool const broken = std::ranges::any_of(rules_.rules,
            [&](RuleUP const& r) { return r->IsRuleBroken(board_, m); });

        board_.SetValue(m.position, m.value);
        if (broken) return MoveOutcome::Broken;

        return IsSolved() ? MoveOutcome::Solved : MoveOutcome::Consistent;
    }

    auto PuzzleGame::IsSolved() const -> bool
    {
        for (std::size_t r{}; r < board_.Rows(); ++r)
        {
            for (std::size_t c{}; c < board_.Columns(); ++c)
            {
                Cell const& cell = board_.GetCell(Position{static_cast<CoordT>(r), static_cast<CoordT>(c)});
                if (cell.IsBorder()) continue;
                if (cell.Value() == 0) return false;

                Move const probe{cell.Pos(), cell.Value()};
                for (RuleUP const& rule : rules_.rules)
                {
                    if (rule->IsRuleBroken(board_, probe)) return false;
                }
            }
        }
        return true;
    }
}
