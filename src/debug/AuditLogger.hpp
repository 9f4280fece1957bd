//
// AuditLogger.hpp
//

#ifndef NIKOLI_AUDITLOGGER_HPP
#define NIKOLI_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <span>
#include <string>

#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/Types.hpp"

namespace nikoli::core::debug
{
    class AuditLogger
    {
    public:
        // Throws error::ConfigurationError if the file cannot be opened.
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (game name, extents, rules) followed by the rendered board
        auto start(PuzzleGame const& game) -> void;

        // Per move: the proposal and every violation it produced (empty = passes)
        auto move(Move const& m, std::span<error::RuleViolation const> violations) -> void;

        // Per applied move
        auto outcome(MoveOutcome o) -> void;

        // Footer with the final board and solved flag
        auto end(PuzzleGame const& game) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
        std::uint32_t moves_{0};
    };
}

#endif //NIKOLI_AUDITLOGGER_HPP
