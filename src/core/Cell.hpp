//
// Cell.hpp
//

#ifndef NIKOLI_CELL_HPP
#define NIKOLI_CELL_HPP

#include <variant>
#include "Types.hpp"

namespace nikoli::core
{
    struct PlayableCell
    {
        ValueT value{};
    };

    // Border/label cell: anchors the run to its right and the run below it.
    struct ClueCell
    {
        ValueT row_sum{};
        ValueT column_sum{};
    };

    class Cell
    {
    public:
        static auto Playable(Position pos, ValueT value = 0) -> Cell
        {
            return Cell{pos, PlayableCell{value}};
        }

        static auto Clue(Position pos, ValueT row_sum, ValueT column_sum) -> Cell
        {
            return Cell{pos, ClueCell{row_sum, column_sum}};
        }

        auto Pos() const noexcept -> Position { return pos_; }
        auto IsBorder() const noexcept -> bool { return std::holds_alternative<ClueCell>(kind_); }

        // 0 means empty; clue cells never carry a value
        auto Value() const noexcept -> ValueT
        {
            auto const* p = std::get_if<PlayableCell>(&kind_);
            return p ? p->value : 0;
        }

        auto RowSum() const noexcept -> ValueT
        {
            auto const* c = std::get_if<ClueCell>(&kind_);
            return c ? c->row_sum : 0;
        }

        auto ColumnSum() const noexcept -> ValueT
        {
            auto const* c = std::get_if<ClueCell>(&kind_);
            return c ? c->column_sum : 0;
        }

        // Copy of this cell holding another value. Clue cells are returned unchanged.
        auto WithValue(ValueT v) const -> Cell
        {
            if (IsBorder()) return *this;
            return Cell{pos_, PlayableCell{v}};
        }

    private:
        Cell(Position pos, std::variant<PlayableCell, ClueCell> kind) :
            pos_{pos}, kind_{kind}
        {
        }

        Position pos_;
        std::variant<PlayableCell, ClueCell> kind_;
    };
}

#endif //NIKOLI_CELL_HPP
