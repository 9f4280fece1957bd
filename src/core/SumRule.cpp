//
// SumRule.cpp
//
#include "SumRule.hpp"

#include <format>
#include "Board.hpp"
#include "PendingMoveView.hpp"

namespace
{
    using nikoli::core::Axis;
    using nikoli::core::BoardIterator;
    using nikoli::core::Cell;
    using nikoli::core::SumT;

    // Axis hooks: rows run left to right, columns top to bottom.
    auto HasPrevious(BoardIterator const& it, Axis axis, Cell const& c) -> bool
    {
        return axis == Axis::Row ? it.HasCellLeft(c) : it.HasCellTop(c);
    }

    auto PreviousCell(BoardIterator const& it, Axis axis, Cell const& c) -> Cell const&
    {
        return axis == Axis::Row ? it.GetCellLeft(c) : it.GetCellTop(c);
    }

    auto NextCell(BoardIterator const& it, Axis axis, Cell const& c) -> Cell const&
    {
        return axis == Axis::Row ? it.GetCellRight(c) : it.GetCellBottom(c);
    }

    // A run ends at the grid edge or at the next clue cell.
    auto HasNext(BoardIterator const& it, Axis axis, Cell const& c) -> bool
    {
        bool const exists = axis == Axis::Row ? it.HasCellRight(c) : it.HasCellBottom(c);
        return exists && !NextCell(it, axis, c).IsBorder();
    }

    auto SumExpected(Axis axis, Cell const& clue) -> SumT
    {
        return axis == Axis::Row ? clue.RowSum() : clue.ColumnSum();
    }
}

namespace nikoli::core
{
    auto SumRule::Accumulate(BoardIterator const& it, Axis axis, Cell const& start) -> RunTotal
    {
        SumT sum{0};

        // Backward to the clue. A board without one runs off the grid and throws OutOfBoundsError.
        Cell const* cell = &start;
        while (!cell->IsBorder())
        {
            sum += cell->Value();
            cell = &PreviousCell(it, axis, *cell);
        }
        Cell const& clue = *cell;

        // Forward over the far side of the run
        cell = &start;
        while (HasNext(it, axis, *cell))
        {
            cell = &NextCell(it, axis, *cell);
            sum += cell->Value();
        }

        return RunTotal{.anchor = clue.Pos(), .expected = SumExpected(axis, clue), .actual = sum};
    }

    auto SumRule::Validate(BoardIterator const& it, Move const& m) const -> CheckResult
    {
        PendingMoveView const view{it, m};
        RunTotal const total = Accumulate(view, axis_, view.GetCell(m.position));

        if (total.actual != total.expected)
        {
            return std::unexpected(error::RuleViolation{.code = error::RuleViolationCode::Sum_Mismatch}
                                   .with_rule(Name())
                                   .with_position(m.position)
                                   .with_anchor(total.anchor)
                                   .with_axis(axis_)
                                   .with_expected(total.expected)
                                   .with_actual(total.actual));
        }
        return {};
    }

    auto SumRule::Name() const noexcept -> std::string_view
    {
        return axis_ == Axis::Row ? "SumRowRule" : "SumColumnRule";
    }

    auto SumRule::CheckBoard(GameBoard const& board) const -> void
    {
        for (std::size_t r{}; r < board.Rows(); ++r)
        {
            for (std::size_t c{}; c < board.Columns(); ++c)
            {
                Position const start{static_cast<CoordT>(r), static_cast<CoordT>(c)};
                Cell const* cell = &board.GetCell(start);
                while (!cell->IsBorder())
                {
                    if (!HasPrevious(board, axis_, *cell))
                    {
                        NKL_THROW(error::Code::Configuration,
                                  std::format("{}: cell ({},{}) has no clue cell before it along its {}",
                                              Name(), r, c, to_string(axis_)));
                    }
                    cell = &PreviousCell(board, axis_, *cell);
                }
            }
        }
    }
}
