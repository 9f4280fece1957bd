//
// Fixtures.hpp
//

#ifndef NIKOLI_TESTS_FIXTURES_HPP
#define NIKOLI_TESTS_FIXTURES_HPP

#include <initializer_list>
#include <memory>
#include <vector>

#include "../core/Board.hpp"
#include "../core/Cell.hpp"
#include "../core/Game.hpp"
#include "../core/SumRule.hpp"

namespace nikoli::test
{
    using namespace nikoli::core;

    inline auto P(int r, int c) -> Position
    {
        return Position{static_cast<CoordT>(r), static_cast<CoordT>(c)};
    }

    // Single row: a clue holding `expected`, then the given playable values.
    inline auto RowRun(ValueT expected, std::initializer_list<ValueT> values) -> GameBoard
    {
        std::vector<Cell> row;
        row.push_back(Cell::Clue(P(0, 0), expected, 0));
        int c = 1;
        for (ValueT v : values) row.push_back(Cell::Playable(P(0, c++), v));
        return GameBoard{CellMatrix{std::move(row)}};
    }

    // Single column: a clue holding `expected`, then the given playable values.
    inline auto ColumnRun(ValueT expected, std::initializer_list<ValueT> values) -> GameBoard
    {
        CellMatrix m;
        m.push_back({Cell::Clue(P(0, 0), 0, expected)});
        int r = 1;
        for (ValueT v : values) m.push_back({Cell::Playable(P(r++, 0), v)});
        return GameBoard{std::move(m)};
    }

    //      .    4    6
    //      3    a    b        solution: a=1 b=2
    //      7    c    d                  c=3 d=4
    inline auto Kakuro3x3(ValueT a = 0, ValueT b = 0, ValueT c = 0, ValueT d = 0) -> GameBoard
    {
        CellMatrix m{
            {Cell::Clue(P(0, 0), 0, 0), Cell::Clue(P(0, 1), 0, 4), Cell::Clue(P(0, 2), 0, 6)},
            {Cell::Clue(P(1, 0), 3, 0), Cell::Playable(P(1, 1), a), Cell::Playable(P(1, 2), b)},
            {Cell::Clue(P(2, 0), 7, 0), Cell::Playable(P(2, 1), c), Cell::Playable(P(2, 2), d)},
        };
        return GameBoard{std::move(m)};
    }

    inline auto SumRules() -> GameRules
    {
        GameRules rules{};
        rules.game_name = "kakuro";
        rules.rules.push_back(std::make_unique<SumRule>(Axis::Row));
        rules.rules.push_back(std::make_unique<SumRule>(Axis::Column));
        return rules;
    }

    inline auto MakeKakuro(ValueT a = 0, ValueT b = 0, ValueT c = 0, ValueT d = 0) -> PuzzleGame
    {
        return PuzzleGame{Kakuro3x3(a, b, c, d), SumRules()};
    }
}

#endif //NIKOLI_TESTS_FIXTURES_HPP
