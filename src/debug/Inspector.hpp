//
// Inspector.hpp
//

#ifndef NIKOLI_INSPECTOR_HPP
#define NIKOLI_INSPECTOR_HPP

#include <cstddef>
#include <format>
#include <string>
#include <vector>

#include "../core/Board.hpp"
#include "../core/Types.hpp"

namespace nikoli::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::size_t rows{};
            std::vector<std::size_t> row_widths;
            std::vector<std::vector<Position>> positions; // as stored, not as indexed
            std::size_t clue_cells{};
            std::size_t empty_cells{};
        };

        static inline auto Gather(GameBoard const& b) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.rows = b.matrix_.size();
            ret.row_widths.reserve(ret.rows);
            ret.positions.resize(ret.rows);

            for (std::size_t r{}; r < b.matrix_.size(); ++r)
            {
                ret.row_widths.push_back(b.matrix_[r].size());
                for (Cell const& c : b.matrix_[r])
                {
                    ret.positions[r].push_back(c.Pos());
                    ret.clue_cells += c.IsBorder();
                    ret.empty_cells += (!c.IsBorder() && c.Value() == 0);
                }
            }
            return ret;
        }

        // One line per row. Clues print as "col\row" totals, empty cells as ".".
        static inline auto Render(GameBoard const& b) -> std::string
        {
            std::string out;
            for (auto const& row : b.matrix_)
            {
                for (Cell const& c : row)
                {
                    if (c.IsBorder())
                        out += std::format("{:>6}", std::format("{}\\{}", c.ColumnSum(), c.RowSum()));
                    else if (c.Value() == 0)
                        out += std::format("{:>6}", ".");
                    else
                        out += std::format("{:>6}", c.Value());
                }
                out += '\n';
            }
            return out;
        }
    };
}

#endif //NIKOLI_INSPECTOR_HPP
