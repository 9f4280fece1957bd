//
// RuleFactory.hpp
//

#ifndef NIKOLI_RULEFACTORY_HPP
#define NIKOLI_RULEFACTORY_HPP

#include <span>
#include <string>
#include <string_view>
#include "Rules.hpp"

namespace nikoli::core
{
    // Throws error::UnknownRuleError for names without an implementation.
    auto MakeRuleByName(std::string_view name) -> RuleUP;

    auto MakeGameRules(std::string game_name, std::span<std::string const> names) -> GameRules;
}

#endif //NIKOLI_RULEFACTORY_HPP
