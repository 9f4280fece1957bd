//
// BoardIterator.hpp
//

#ifndef NIKOLI_BOARDITERATOR_HPP
#define NIKOLI_BOARDITERATOR_HPP

#include <cstddef>
#include "Cell.hpp"
#include "Types.hpp"

namespace nikoli::core
{
    // Storage-agnostic read access to a grid of cells. Traversal is stateless:
    // every call names the cell it starts from.
    // GetCell* throws error::OutOfBoundsError where the matching HasCell* is false.
    class BoardIterator
    {
    public:
        virtual ~BoardIterator() = default;

        virtual auto Rows() const noexcept -> std::size_t = 0;
        virtual auto Columns() const noexcept -> std::size_t = 0;

        virtual auto HasCellTop(Cell const& cell) const -> bool = 0;
        virtual auto HasCellBottom(Cell const& cell) const -> bool = 0;
        virtual auto HasCellLeft(Cell const& cell) const -> bool = 0;
        virtual auto HasCellRight(Cell const& cell) const -> bool = 0;

        virtual auto GetCell(Position pos) const -> Cell const& = 0;
        virtual auto GetCellTop(Cell const& cell) const -> Cell const& = 0;
        virtual auto GetCellBottom(Cell const& cell) const -> Cell const& = 0;
        virtual auto GetCellLeft(Cell const& cell) const -> Cell const& = 0;
        virtual auto GetCellRight(Cell const& cell) const -> Cell const& = 0;
    };
}

#endif //NIKOLI_BOARDITERATOR_HPP
