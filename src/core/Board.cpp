//
// Board.cpp
//
#include "Board.hpp"

#include <format>
#include <utility>
#include "Exception.hpp"

namespace nikoli::core
{
    GameBoard::GameBoard(CellMatrix matrix) :
        matrix_(std::move(matrix))
    {
        if (matrix_.empty() || matrix_.front().empty())
        {
            NKL_THROW(error::Code::Board, "Board must have at least one row and one column");
        }

        std::size_t const width = matrix_.front().size();
        for (std::size_t r{}; r < matrix_.size(); ++r)
        {
            if (matrix_[r].size() != width)
            {
                NKL_THROW(error::Code::Board,
                          std::format("Jagged board: row {} has {} cells, expected {}", r, matrix_[r].size(), width));
            }
            for (std::size_t c{}; c < width; ++c)
            {
                Position const p = matrix_[r][c].Pos();
                if (p.row != r || p.column != c)
                {
                    NKL_THROW(error::Code::Board,
                              std::format("Cell at index ({},{}) claims position ({},{})", r, c, p.row, p.column));
                }
            }
        }
    }

    auto GameBoard::Contains(Position pos) const noexcept -> bool
    {
        return pos.row < Rows() && pos.column < Columns();
    }

    auto GameBoard::At(int row, int column) const -> Cell const&
    {
        if (row < 0 || column < 0 ||
            static_cast<std::size_t>(row) >= Rows() || static_cast<std::size_t>(column) >= Columns())
        {
            NKL_THROW(error::Code::OutOfBounds,
                      std::format("({},{}) is outside the {}x{} board", row, column, Rows(), Columns()));
        }
        return matrix_[static_cast<std::size_t>(row)][static_cast<std::size_t>(column)];
    }

    auto GameBoard::HasCellTop(Cell const& cell) const -> bool
    {
        return cell.Pos().row > 0;
    }

    auto GameBoard::HasCellBottom(Cell const& cell) const -> bool
    {
        return cell.Pos().row + std::size_t{1} < Rows();
    }

    auto GameBoard::HasCellLeft(Cell const& cell) const -> bool
    {
        return cell.Pos().column > 0;
    }

    auto GameBoard::HasCellRight(Cell const& cell) const -> bool
    {
        return cell.Pos().column + std::size_t{1} < Columns();
    }

    auto GameBoard::GetCell(Position pos) const -> Cell const&
    {
        return At(pos.row, pos.column);
    }

    auto GameBoard::GetCellTop(Cell const& cell) const -> Cell const&
    {
        return At(cell.Pos().row - 1, cell.Pos().column);
    }

    auto GameBoard::GetCellBottom(Cell const& cell) const -> Cell const&
    {
        return At(cell.Pos().row + 1, cell.Pos().column);
    }

    auto GameBoard::GetCellLeft(Cell const& cell) const -> Cell const&
    {
        return At(cell.Pos().row, cell.Pos().column - 1);
    }

    auto GameBoard::GetCellRight(Cell const& cell) const -> Cell const&
    {
        return At(cell.Pos().row, cell.Pos().column + 1);
    }

    auto GameBoard::SetValue(Position pos, ValueT value) -> void
    {
        Cell const& current = GetCell(pos);
        if (current.IsBorder())
        {
            NKL_THROW(error::Code::Board, std::format("Cannot write into clue cell ({},{})", pos.row, pos.column));
        }
        matrix_[pos.row][pos.column] = current.WithValue(value);
    }
}
