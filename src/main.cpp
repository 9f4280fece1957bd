//
// main.cpp: move checker for configured puzzles
//

#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "core/Types.hpp"
#include "core/Util.hpp"
#include "conf/ConfigurationReader.hpp"
#include "conf/codec.hpp"
#include "debug/AuditLogger.hpp"
#include "debug/Inspector.hpp"

namespace
{
    struct CheckerConfig
    {
        std::string config_dir{"configurationFiles"};
        std::string game{};
        std::string audit_log{};
        std::string compile_out{};
        bool play{false};
        std::vector<std::string> moves{};
    };

    auto ParseArgs(int argc, char** argv) -> std::optional<CheckerConfig>
    {
        CheckerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            bool ok = true;
            if (arg == "--config-dir") { ok = next_str(cfg.config_dir); }
            else if (arg == "--game") { ok = next_str(cfg.game); }
            else if (arg == "--log") { ok = next_str(cfg.audit_log); }
            else if (arg == "--compile") { ok = next_str(cfg.compile_out); }
            else if (arg == "--play") { cfg.play = true; }
            else if (arg.starts_with("--"))
            {
                std::print(stderr, "unknown option {}\n", arg);
                return std::nullopt;
            }
            else { cfg.moves.push_back(arg); }

            if (!ok)
            {
                std::print(stderr, "option {} needs a value\n", arg);
                return std::nullopt;
            }
        }

        if (cfg.game.empty())
        {
            std::print(stderr, "--game is required\n");
            return std::nullopt;
        }
        return cfg;
    }

    auto WriteCompiled(nikoli::core::PuzzleGame const& game, std::string const& path) -> bool
    {
        flatbuffers::DetachedBuffer const buf = nikoli::core::conf::EncodeBoard(game.Board(), game.Name());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        return static_cast<bool>(out);
    }
}

int main(int argc, char** argv)
{
    using namespace nikoli::core;

    std::optional<CheckerConfig> const parsed = ParseArgs(argc, argv);
    if (!parsed)
    {
        std::print(stderr, "usage: nikoli_check --game NAME [--config-dir DIR] [--log PATH] "
                           "[--compile OUT] [--play] row,column=value...\n");
        return 2;
    }
    CheckerConfig const& cc = *parsed;

    try
    {
        conf::ConfigurationReader const reader{cc.config_dir};
        PuzzleGame game = reader.ReadGame(cc.game);

        std::print("[nikoli] loaded '{}' ({}x{}, {} rule(s))\n",
                   game.Name(), game.Board().Rows(), game.Board().Columns(), game.Rules().size());

        if (!cc.compile_out.empty())
        {
            if (!WriteCompiled(game, cc.compile_out))
            {
                std::print(stderr, "[nikoli] cannot write {}\n", cc.compile_out);
                return 2;
            }
            std::print("[nikoli] wrote {}\n", cc.compile_out);
        }

        std::unique_ptr<debug::AuditLogger> log;
        if (!cc.audit_log.empty())
        {
            log = std::make_unique<debug::AuditLogger>(cc.audit_log);
            log->start(game);
        }

        bool all_ok = true;
        for (std::string const& text : cc.moves)
        {
            std::optional<Move> const m = util::ParseMoveText(text);
            if (!m)
            {
                std::print(stderr, "[nikoli] cannot parse move '{}' (expected row,column=value)\n", text);
                all_ok = false;
                continue;
            }

            std::vector<error::RuleViolation> const vs = game.Violations(*m);
            if (log) log->move(*m, vs);

            std::print("{} {}\n", text, vs.empty() ? "ok" : "broken");
            for (error::RuleViolation const& v : vs)
            {
                std::print("  {}\n", error::describe(v));
            }

            if (cc.play)
            {
                MoveOutcome const out = game.Play(*m);
                if (log) log->outcome(out);
                std::print("  => {}\n", to_string(out));
                all_ok &= (out == MoveOutcome::Consistent || out == MoveOutcome::Solved);
            }
            else
            {
                all_ok &= vs.empty();
            }
        }

        if (cc.play)
        {
            std::print("{}", debug::Inspector::Render(game.Board()));
        }
        if (log) log->end(game);

        return all_ok ? 0 : 1;
    }
    catch (error::OutOfBoundsError const& e)
    {
        // a move walked off a board the load-time checks did not cover
        std::print(stderr, "[nikoli] out of bounds: {}\n{}", e.what(), e.to_str());
        return 1;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 2;
    }
}
