#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <utility>

#include "Inspector.hpp"

using namespace nikoli::core;

namespace
{

auto s_pos(Position const p) -> std::string
{
    return std::format("({},{})", p.row, p.column);
}

auto s_move(Move const& m) -> std::string
{
    return std::format("{}={}", s_pos(m.position), m.value);
}

auto s_rules(PuzzleGame const& g) -> std::string
{
    std::string body;
    for (RuleUP const& r : g.Rules())
    {
        body += body.empty() ? "" : ",";
        body += r->Name();
    }
    return body;
}

} // namespace

namespace nikoli::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(path, std::ios::out | std::ios::trunc)
{
    if (!out_)
    {
        NKL_THROW(error::Code::Configuration, std::format("Cannot open audit log '{}'", path));
    }
}

AuditLogger::~AuditLogger()
{
    if (out_.is_open())
    {
        out_.flush();
    }
}

auto AuditLogger::start(PuzzleGame const& game) -> void
{
    GameBoard const& b = game.Board();
    out_ << std::format("GAME name={} size={}x{} rules=[{}]\n",
                        game.Name(), b.Rows(), b.Columns(), s_rules(game));
    out_ << Inspector::Render(b);
}

auto AuditLogger::move(Move const& m, std::span<error::RuleViolation const> violations) -> void
{
    ++moves_;
    out_ << std::format("MOVE #{} {} {}\n", moves_, s_move(m), violations.empty() ? "ok" : "violates");
    for (error::RuleViolation const& v : violations)
    {
        out_ << "  - " << error::describe(v) << '\n';
    }
}

auto AuditLogger::outcome(MoveOutcome const o) -> void
{
    out_ << std::format("  => {}\n", to_string(o));
}

auto AuditLogger::end(PuzzleGame const& game) -> void
{
    out_ << Inspector::Render(game.Board());
    out_ << std::format("END moves={} solved={}\n", moves_, game.IsSolved() ? "yes" : "no");
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace nikoli::core::debug
