//
// Board.hpp
//

#ifndef NIKOLI_BOARD_HPP
#define NIKOLI_BOARD_HPP

#include <vector>
#include "BoardIterator.hpp"
#include "Cell.hpp"
#include "Types.hpp"

namespace nikoli::core::debug {struct Inspector;}
namespace nikoli::core
{
    using CellMatrix = std::vector<std::vector<Cell>>;

    class GameBoard final : public BoardIterator
    {
    public:
        GameBoard() = delete;
        // Throws error::BoardError on an empty, jagged or position-inconsistent matrix.
        explicit GameBoard(CellMatrix matrix);

        auto Rows() const noexcept -> std::size_t override { return matrix_.size(); }
        auto Columns() const noexcept -> std::size_t override { return matrix_.empty() ? 0 : matrix_.front().size(); }
        auto Contains(Position pos) const noexcept -> bool;

        auto HasCellTop(Cell const& cell) const -> bool override;
        auto HasCellBottom(Cell const& cell) const -> bool override;
        auto HasCellLeft(Cell const& cell) const -> bool override;
        auto HasCellRight(Cell const& cell) const -> bool override;

        auto GetCell(Position pos) const -> Cell const& override;
        auto GetCellTop(Cell const& cell) const -> Cell const& override;
        auto GetCellBottom(Cell const& cell) const -> Cell const& override;
        auto GetCellLeft(Cell const& cell) const -> Cell const& override;
        auto GetCellRight(Cell const& cell) const -> Cell const& override;

        // The only mutation. Throws OutOfBoundsError outside the grid and BoardError on clue cells.
        auto SetValue(Position pos, ValueT value) -> void;

        friend struct debug::Inspector;

    private:
        auto At(int row, int column) const -> Cell const&;

    private:
        CellMatrix matrix_;
    };
}

#endif //NIKOLI_BOARD_HPP
