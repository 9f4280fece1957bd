//
// PendingMoveView.hpp
//

#ifndef NIKOLI_PENDINGMOVEVIEW_HPP
#define NIKOLI_PENDINGMOVEVIEW_HPP

#include <optional>
#include "BoardIterator.hpp"
#include "Types.hpp"

namespace nikoli::core
{
    // Read-only overlay that shows a board as if the move had been applied.
    // The wrapped iterator must outlive the view.
    class PendingMoveView final : public BoardIterator
    {
    public:
        PendingMoveView(BoardIterator const& base, Move const& move);

        auto Rows() const noexcept -> std::size_t override { return base_.Rows(); }
        auto Columns() const noexcept -> std::size_t override { return base_.Columns(); }

        auto HasCellTop(Cell const& cell) const -> bool override { return base_.HasCellTop(cell); }
        auto HasCellBottom(Cell const& cell) const -> bool override { return base_.HasCellBottom(cell); }
        auto HasCellLeft(Cell const& cell) const -> bool override { return base_.HasCellLeft(cell); }
        auto HasCellRight(Cell const& cell) const -> bool override { return base_.HasCellRight(cell); }

        auto GetCell(Position pos) const -> Cell const& override;
        auto GetCellTop(Cell const& cell) const -> Cell const& override;
        auto GetCellBottom(Cell const& cell) const -> Cell const& override;
        auto GetCellLeft(Cell const& cell) const -> Cell const& override;
        auto GetCellRight(Cell const& cell) const -> Cell const& override;

    private:
        auto Patch(Cell const& from_base) const -> Cell const&;

    private:
        BoardIterator const& base_;
        Move move_;
        // empty when the target is outside the grid
        std::optional<Cell> patched_;
    };
}

#endif //NIKOLI_PENDINGMOVEVIEW_HPP
