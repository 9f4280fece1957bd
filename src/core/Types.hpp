//
// Types.hpp
//

#ifndef NIKOLI_TYPES_HPP
#define NIKOLI_TYPES_HPP

#define NKL_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <string_view>

namespace nikoli::core
{
    using CoordT = std::uint16_t;
    using ValueT = std::int32_t;
    // Run totals: wide enough for any run of ValueT cells
    using SumT = std::int64_t;

    struct Position
    {
        CoordT row{};
        CoordT column{};

        auto operator==(Position const&) const -> bool = default;
    };

    // A proposed write, pending validation.
    struct Move
    {
        Position position{};
        ValueT value{};
    };

    enum class Axis : uint8_t
    {
        Row = 0,
        Column
    };

    enum class MoveOutcome : uint8_t
    {
        Invalid,    // target rejected, board untouched
        Broken,     // applied, at least one rule now broken
        Consistent, // applied, no rule broken
        Solved      // applied, puzzle complete
    };

    inline auto to_string(Axis a) -> std::string_view
    {
        return a == Axis::Row ? "row" : "column";
    }

    inline auto to_string(MoveOutcome o) -> std::string_view
    {
        switch (o)
        {
        case MoveOutcome::Invalid: return "invalid";
        case MoveOutcome::Broken: return "broken";
        case MoveOutcome::Consistent: return "consistent";
        case MoveOutcome::Solved: return "solved";
        }
        return "?";
    }
}

#endif //NIKOLI_TYPES_HPP
