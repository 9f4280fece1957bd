//
// SumRule.hpp
//

#ifndef NIKOLI_SUMRULE_HPP
#define NIKOLI_SUMRULE_HPP

#include "Rules.hpp"

namespace nikoli::core
{
    // A run of playable cells along one axis must add up to the total stored in the
    // clue cell that anchors it (left end for rows, top end for columns).
    class SumRule final : public Rule
    {
    public:
        explicit SumRule(Axis axis) : axis_(axis) {}

        auto Validate(BoardIterator const& it, Move const& m) const -> CheckResult override;
        auto Name() const noexcept -> std::string_view override;
        auto CheckBoard(GameBoard const& board) const -> void override;

        auto GetAxis() const noexcept -> Axis { return axis_; }

        // Sum of the run through `start`, with the clue that anchors it.
        struct RunTotal
        {
            Position anchor{};
            SumT expected{};
            SumT actual{};
        };
        static auto Accumulate(BoardIterator const& it, Axis axis, Cell const& start) -> RunTotal;

    private:
        Axis axis_;
    };
}

#endif //NIKOLI_SUMRULE_HPP
