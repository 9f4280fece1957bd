//
// codec.cpp
//
#include "codec.hpp"

#include <flatbuffers/idl.h>
#include <utility>

#include "../core/RuleFactory.hpp"
#include "generated/PuzzleSchema.hpp"

namespace
{
    namespace fbconf = nikoli::gen::conf;

    inline auto RootName(nikoli::core::conf::Document kind) -> char const*
    {
        return kind == nikoli::core::conf::Document::Board ? "BoardDef" : "RulesDef";
    }

    inline auto AsU8(std::span<std::byte const> bytes) -> std::uint8_t const*
    {
        return reinterpret_cast<std::uint8_t const*>(bytes.data());
    }
} // anonymous

namespace nikoli::core::conf
{
    // ---------- JSON ----------

    auto JsonToBinary(std::string_view json, Document kind)
        -> std::expected<std::vector<std::uint8_t>, ParseError>
    {
        flatbuffers::Parser parser;

        std::string const schema{PuzzleSchemaText};
        if (!parser.Parse(schema.c_str()))
            return std::unexpected(ParseError{"schema: " + parser.error_});

        if (!parser.SetRootType(RootName(kind)))
            return std::unexpected(ParseError{std::string{"no root table "} + RootName(kind)});

        std::string const text{json};
        if (!parser.Parse(text.c_str()))
            return std::unexpected(ParseError{parser.error_});

        std::uint8_t const* p = parser.builder_.GetBufferPointer();
        return std::vector<std::uint8_t>(p, p + parser.builder_.GetSize());
    }

    // ---------- Builders ----------

    auto EncodeBoard(GameBoard const& board, std::string_view game)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbconf::RowDef>> rows;
        rows.reserve(board.Rows());
        for (std::size_t r{}; r < board.Rows(); ++r)
        {
            std::vector<flatbuffers::Offset<fbconf::CellDef>> cells;
            cells.reserve(board.Columns());
            for (std::size_t c{}; c < board.Columns(); ++c)
            {
                Cell const& cell = board.GetCell(Position{static_cast<CoordT>(r), static_cast<CoordT>(c)});
                cells.push_back(fbconf::CreateCellDef(
                    fbb,
                    /*row*/ cell.Pos().row,
                    /*column*/ cell.Pos().column,
                    /*value*/ cell.Value(),
                    /*border*/ cell.IsBorder(),
                    /*row_sum*/ cell.RowSum(),
                    /*column_sum*/ cell.ColumnSum()));
            }
            rows.push_back(fbconf::CreateRowDef(fbb, fbb.CreateVector(cells)));
        }

        auto const name = fbb.CreateString(game.data(), game.size());
        auto const root = fbconf::CreateBoardDef(fbb, name, fbb.CreateVector(rows));
        fbconf::FinishBoardDefBuffer(fbb, root);
        return fbb.Release();
    }

    auto EncodeRules(GameRules const& rules)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<std::string> names;
        names.reserve(rules.rules.size());
        for (RuleUP const& r : rules.rules)
        {
            names.emplace_back(r->Name());
        }

        auto const game = fbb.CreateString(rules.game_name);
        auto const root = fbconf::CreateRulesDef(fbb, game, fbb.CreateVectorOfStrings(names));
        fbb.Finish(root);
        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodeBoard(std::span<std::byte const> bytes)
        -> std::expected<GameBoard, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        flatbuffers::Verifier verifier(AsU8(bytes), bytes.size());
        if (!fbconf::VerifyBoardDefBuffer(verifier))
            return std::unexpected(ParseError{"board buffer failed verification"});

        fbconf::BoardDef const* def = fbconf::GetBoardDef(AsU8(bytes));
        if (!def->rows() || def->rows()->size() == 0)
            return std::unexpected(ParseError{"board has no rows"});

        CellMatrix matrix;
        matrix.reserve(def->rows()->size());
        for (fbconf::RowDef const* row : *def->rows())
        {
            std::vector<Cell>& out = matrix.emplace_back();
            if (!row->cells()) continue; // an empty row is rejected by GameBoard as jagged

            out.reserve(row->cells()->size());
            for (fbconf::CellDef const* c : *row->cells())
            {
                Position const pos{c->row(), c->column()};
                out.push_back(c->border()
                                  ? Cell::Clue(pos, c->row_sum(), c->column_sum())
                                  : Cell::Playable(pos, c->value()));
            }
        }

        return GameBoard{std::move(matrix)};
    }

    auto DecodeRules(std::span<std::byte const> bytes)
        -> std::expected<GameRules, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        flatbuffers::Verifier verifier(AsU8(bytes), bytes.size());
        if (!verifier.VerifyBuffer<fbconf::RulesDef>(nullptr))
            return std::unexpected(ParseError{"rules buffer failed verification"});

        auto const* def = flatbuffers::GetRoot<fbconf::RulesDef>(AsU8(bytes));

        std::vector<std::string> names;
        if (auto const* v = def->rules())
        {
            names.reserve(v->size());
            for (flatbuffers::String const* s : *v)
            {
                names.emplace_back(s->str());
            }
        }

        std::string game = def->game() ? def->game()->str() : std::string{};
        return MakeGameRules(std::move(game), names);
    }
} // namespace nikoli::core::conf
