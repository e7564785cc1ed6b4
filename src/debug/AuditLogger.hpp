//
// AuditLogger.hpp — append-only text transcript of one session
//

#ifndef POKERPRO_AUDITLOGGER_HPP
#define POKERPRO_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../core/Exception.hpp"
#include "../core/Messages.hpp"
#include "../core/Model.hpp"
#include "../core/Store.hpp"

namespace pokerpro::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (hand, mode, seats, seed)
        auto start(HandData const& hand, SessionMode mode, std::uint64_t seed) -> void;

        // One line per processed message, then the outcome it produced
        auto message(Msg const& m) -> void;
        auto outcome(Model const& m, std::optional<error::Rejection> const& rejection, bool committed) -> void;

        // Footer with the final table
        auto end(Model const& m) -> void;

        auto flush() -> void;

        [[nodiscard]] auto lines() const -> std::uint64_t;

        // Store tap writing message + outcome for every processed message
        static auto TapFor(std::shared_ptr<AuditLogger> logger) -> Store::Tap;

    private:
        mutable std::mutex mtx_;
        std::ofstream out_;
        std::uint64_t lines_{};
    };
}

#endif //POKERPRO_AUDITLOGGER_HPP
