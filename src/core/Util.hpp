//
// Util.hpp
//

#ifndef NIKOLI_UTIL_HPP
#define NIKOLI_UTIL_HPP

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>
#include "Types.hpp"

namespace nikoli::core::util
{
    template <typename T>
    inline auto ParseNumber(std::string_view s) -> std::optional<T>
    {
        T out{};
        auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
        return out;
    }

    // "row,column=value", e.g. "1,2=7"
    inline auto ParseMoveText(std::string_view text) -> std::optional<Move>
    {
        std::size_t const comma = text.find(',');
        std::size_t const eq = text.find('=');
        if (comma == std::string_view::npos || eq == std::string_view::npos || eq < comma)
            return std::nullopt;

        auto const row = ParseNumber<CoordT>(text.substr(0, comma));
        auto const column = ParseNumber<CoordT>(text.substr(comma + 1, eq - comma - 1));
        auto const value = ParseNumber<ValueT>(text.substr(eq + 1));
        if (!row || !column || !value) return std::nullopt;

        return Move{Position{*row, *column}, *value};
    }
}

#endif //NIKOLI_UTIL_HPP
