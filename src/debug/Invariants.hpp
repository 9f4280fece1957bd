//
// Invariants.hpp
//

#ifndef NIKOLI_INVARIANTS_HPP
#define NIKOLI_INVARIANTS_HPP

#include "../core/Board.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"

namespace nikoli::core::debug
{
    // Second layer of checks on a board, for tests and debug builds.
    inline auto CheckInvariants(GameBoard const& b) -> void
    {
#if NKL_ENABLE_TEST_HOOKS == false
        (void)b;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(b);

        // 1) Non-empty and rectangular
        NKL_ASSERT(s.rows > 0, "Board has no rows");
        for (std::size_t const w : s.row_widths)
        {
            NKL_ASSERT(w == s.row_widths.front(), "Jagged board");
        }
        NKL_ASSERT(s.row_widths.front() > 0, "Board has no columns");

        // 2) Every cell sits at the index it claims
        for (std::size_t r{}; r < s.positions.size(); ++r)
        {
            for (std::size_t c{}; c < s.positions[r].size(); ++c)
            {
                Position const p = s.positions[r][c];
                NKL_ASSERT(p.row == r && p.column == c, "Cell position differs from its index");
            }
        }

        // 3) The extents reported through the iterator match the storage
        NKL_ASSERT(b.Rows() == s.rows && b.Columns() == s.row_widths.front(), "Iterator extents drifted");
#endif // NKL_ENABLE_TEST_HOOKS == true
    }
}
#endif //NIKOLI_INVARIANTS_HPP
