#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: spdlog category logger + orchestration counters.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace remedy::obs {

    /** @struct Counters
     *  @brief Process-level counters for orchestration decisions.
     */
    struct Counters {
        uint64_t incidents_received{0};   ///< New incidents persisted
        uint64_t duplicates{0};           ///< Incidents collapsed into an existing one
        uint64_t unroutable{0};           ///< Incidents created directly in failed
        uint64_t remediation_skipped{0};  ///< Suppressed by a custom rule
        uint64_t dispatched{0};           ///< Transport accepted the job
        uint64_t dispatch_failures{0};    ///< Retries exhausted
        uint64_t queued{0};               ///< Admission deferred to the backlog
        uint64_t dequeued{0};             ///< Released from the backlog
        uint64_t completions{0};          ///< Completion callbacks applied
        uint64_t completions_ignored{0};  ///< Stale/duplicate callbacks ignored
    };

    /** @enum Signal
     *  @brief One increment of the matching Counters field.
     */
    enum class Signal : uint8_t {
        IncidentReceived,
        Duplicate,
        Unroutable,
        RemediationSkipped,
        Dispatched,
        DispatchFailed,
        Queued,
        Dequeued,
        Completed,
        CompletionIgnored
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single orchestration signal.
        virtual void record(Signal s) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Lock-free counting observer.
    class CountingObserver final : public Observer {
    public:
        void record(Signal s) override;
        Counters snapshot() const override;

    private:
        static constexpr std::size_t kSignals = 10;
        std::atomic<uint64_t> slots_[kSignals]{};
    };

    /// Process-wide counting observer.
    Observer* make_simple_observer();

    /// The "remedy" category logger (created on first use, stdout color sink).
    std::shared_ptr<spdlog::logger> logger();

    /// Apply level ("trace".."off") and the standard pattern. Unknown names fall back to info.
    void configure_logging(std::string_view level);

} // namespace remedy::obs
