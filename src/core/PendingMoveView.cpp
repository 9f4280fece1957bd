//
// PendingMoveView.cpp
//
#include "PendingMoveView.hpp"

namespace nikoli::core
{
    PendingMoveView::PendingMoveView(BoardIterator const& base, Move const& move) :
        base_(base),
        move_(move)
    {
        if (move_.position.row < base_.Rows() && move_.position.column < base_.Columns())
        {
            patched_ = base_.GetCell(move_.position).WithValue(move_.value);
        }
    }

    auto PendingMoveView::Patch(Cell const& from_base) const -> Cell const&
    {
        if (patched_ && from_base.Pos() == move_.position)
        {
            return *patched_;
        }
        return from_base;
    }

    auto PendingMoveView::GetCell(Position pos) const -> Cell const&
    {
        return Patch(base_.GetCell(pos));
    }

    auto PendingMoveView::GetCellTop(Cell const& cell) const -> Cell const&
    {
        return Patch(base_.GetCellTop(cell));
    }

    auto PendingMoveView::GetCellBottom(Cell const& cell) const -> Cell const&
    {
        return Patch(base_.GetCellBottom(cell));
    }

    auto PendingMoveView::GetCellLeft(Cell const& cell) const -> Cell const&
    {
        return Patch(base_.GetCellLeft(cell));
    }

    auto PendingMoveView::GetCellRight(Cell const& cell) const -> Cell const&
    {
        return Patch(base_.GetCellRight(cell));
    }
}
