//
// codec.hpp
//

#ifndef NIKOLI_CODEC_HPP
#define NIKOLI_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Board.hpp"
#include "../core/Rules.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/nikoli_conf_generated.h"

namespace nikoli::core::conf
{
    struct ParseError
    {
        std::string message;
    };

    // Which table of the schema a document holds
    enum class Document : uint8_t
    {
        Board,
        Rules
    };

    // --- JSON (text) -> FlatBuffer, validated against the embedded schema ---
    auto JsonToBinary(std::string_view json, Document kind)
        -> std::expected<std::vector<std::uint8_t>, ParseError>;

    // --- Outbound builders ---
    auto EncodeBoard(GameBoard const& board, std::string_view game)
        -> flatbuffers::DetachedBuffer;

    auto EncodeRules(GameRules const& rules)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode. Buffers are verified before any field is read. ---
    // Throws error::BoardError when the cells do not form a valid board.
    auto DecodeBoard(std::span<std::byte const> bytes)
        -> std::expected<GameBoard, ParseError>;

    // Throws error::UnknownRuleError for rule names without an implementation.
    auto DecodeRules(std::span<std::byte const> bytes)
        -> std::expected<GameRules, ParseError>;
} // namespace nikoli::core::conf

#endif //NIKOLI_CODEC_HPP
