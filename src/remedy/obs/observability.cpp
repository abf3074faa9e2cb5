/**
 * @file observability.cpp
 * @brief spdlog-backed logger and atomic counters.
 */
#include "remedy/obs/observability.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "remedy/config/constants.hpp"

namespace remedy::obs {

    void CountingObserver::record(Signal s) {
        slots_[static_cast<std::size_t>(s)].fetch_add(1, std::memory_order_relaxed);
    }

    Counters CountingObserver::snapshot() const {
        auto at = [this](Signal s) {
            return slots_[static_cast<std::size_t>(s)].load(std::memory_order_relaxed);
        };
        return Counters{
            .incidents_received  = at(Signal::IncidentReceived),
            .duplicates          = at(Signal::Duplicate),
            .unroutable          = at(Signal::Unroutable),
            .remediation_skipped = at(Signal::RemediationSkipped),
            .dispatched          = at(Signal::Dispatched),
            .dispatch_failures   = at(Signal::DispatchFailed),
            .queued              = at(Signal::Queued),
            .dequeued            = at(Signal::Dequeued),
            .completions         = at(Signal::Completed),
            .completions_ignored = at(Signal::CompletionIgnored),
        };
    }

    Observer* make_simple_observer() {
        static CountingObserver obs; // process-wide singleton
        return &obs;
    }

    std::shared_ptr<spdlog::logger> logger() {
        static auto lg = [] {
            if (auto existing = spdlog::get("remedy")) return existing;
            auto created = spdlog::stdout_color_mt("remedy");
            created->set_pattern(config::constants::LOG_PATTERN);
            return created;
        }();
        return lg;
    }

    void configure_logging(std::string_view level) {
        auto lvl = spdlog::level::from_str(std::string(level));
        // from_str maps unknown names to off; only "off" itself should mean off.
        if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
        auto lg = logger();
        lg->set_level(lvl);
        lg->set_pattern(config::constants::LOG_PATTERN);
    }

} // namespace remedy::obs
