//
// Exception.hpp
//

#ifndef NIKOLI_EXCEPTION_HPP
#define NIKOLI_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace nikoli::core::error
{
    enum class Code : unsigned
    {
        OutOfBounds, // traversal or lookup outside the grid
        Board, // malformed board construction or illegal board mutation
        Configuration, // configuration present but unusable
        ConfigurationNotFound, // configuration file missing
        UnknownRule, // rule name has no implementation
        Assertion // internal assertion failed
    };

    struct OutOfBoundsError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct BoardError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigurationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigurationNotFoundError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct UnknownRuleError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::OutOfBounds: throw OutOfBoundsError(std::move(msg), c);
        case Code::Board: throw BoardError(std::move(msg), c);
        case Code::Configuration: throw ConfigurationError(std::move(msg), c);
        case Code::ConfigurationNotFound: throw ConfigurationNotFoundError(std::move(msg), c);
        case Code::UnknownRule: throw UnknownRuleError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define NKL_THROW(code_enum, msg) ::nikoli::core::error::fail((code_enum), (msg))
#define NKL_ASSERT(cond, msg) do { if(!(cond)) ::nikoli::core::error::fail(::nikoli::core::error::Code::Assertion, (msg)); } while(0)

    enum class RuleViolationCode : std::uint16_t
    {
        // Target checks, done before any rule runs
        Move_OutOfBounds,
        Move_TargetIsClue,
        Move_NegativeValue,

        // Sum rules
        Sum_Mismatch
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::string_view rule{};
        std::optional<Position> position{};
        std::optional<Position> anchor{};
        std::optional<Axis> axis{};
        std::optional<SumT> expected{};
        std::optional<SumT> actual{};

        auto with_rule(std::string_view r) -> RuleViolation&
        {
            rule = r;
            return *this;
        }

        auto with_position(Position p) -> RuleViolation&
        {
            position = p;
            return *this;
        }

        auto with_anchor(Position p) -> RuleViolation&
        {
            anchor = p;
            return *this;
        }

        auto with_axis(Axis a) -> RuleViolation&
        {
            axis = a;
            return *this;
        }

        auto with_expected(SumT v) -> RuleViolation&
        {
            expected = v;
            return *this;
        }

        auto with_actual(SumT v) -> RuleViolation&
        {
            actual = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Move_OutOfBounds: return "Move: target outside the board";
        case E::Move_TargetIsClue: return "Move: target is a clue cell";
        case E::Move_NegativeValue: return "Move: negative value";
        case E::Sum_Mismatch: return "Sum: run total differs from clue";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (!v.rule.empty()) s += std::format(" | rule={}", v.rule);
        if (v.position) s += std::format(" | at=({},{})", v.position->row, v.position->column);
        if (v.anchor) s += std::format(" | clue=({},{})", v.anchor->row, v.anchor->column);
        if (v.axis) s += std::format(" | axis={}", to_string(*v.axis));
        if (v.expected) s += std::format(" | expected={}", *v.expected);
        if (v.actual) s += std::format(" | actual={}", *v.actual);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //NIKOLI_EXCEPTION_HPP
