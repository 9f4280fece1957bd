//
// RuleFactory.cpp
//
#include "RuleFactory.hpp"

#include <format>
#include <utility>
#include "SumRule.hpp"

namespace nikoli::core
{
    auto MakeRuleByName(std::string_view name) -> RuleUP
    {
        if (name == "SumRowRule") return std::make_unique<SumRule>(Axis::Row);
        if (name == "SumColumnRule") return std::make_unique<SumRule>(Axis::Column);

        NKL_THROW(error::Code::UnknownRule, std::format("Unknown rule ({})", name));
    }

    auto MakeGameRules(std::string game_name, std::span<std::string const> names) -> GameRules
    {
        GameRules out{};
        out.game_name = std::move(game_name);
        out.rules.reserve(names.size());
        for (std::string const& n : names)
        {
            out.rules.push_back(MakeRuleByName(n));
        }
        return out;
    }
}
