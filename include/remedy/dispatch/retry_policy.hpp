#pragma once
/**
 * @file retry_policy.hpp
 * @brief Bounded retry with exponential backoff around a DispatchTransport.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "remedy/config/constants.hpp"
#include "remedy/dispatch/dispatch_transport.hpp"
#include "remedy/error.hpp"

namespace remedy::dispatch {

/** @struct RetryConfig
 *  @brief Attempt budget and timing for one dispatch.
 */
struct RetryConfig {
    uint32_t max_attempts{config::constants::DISPATCH_MAX_ATTEMPTS};                 ///< Total attempts
    std::chrono::milliseconds base_delay{config::constants::DISPATCH_BASE_DELAY_MS};  ///< Doubled per attempt
    std::chrono::milliseconds dispatch_timeout{config::constants::DISPATCH_TIMEOUT_MS}; ///< Per attempt
    std::chrono::milliseconds max_delay{config::constants::DISPATCH_MAX_BACKOFF_MS};  ///< Backoff cap
};

/// Backoff slept before attempt `attempt` (0-based): 0, base, 2*base, 4*base ... capped.
std::chrono::milliseconds backoff_for(const RetryConfig& cfg, uint32_t attempt) noexcept;

/** @struct DispatchReceipt
 *  @brief Successful dispatch outcome.
 */
struct DispatchReceipt {
    std::string run_id;
    uint32_t    attempts{0};
};

/** @class RetryingDispatcher
 *  @brief Calls the transport until it succeeds or the attempt budget is spent.
 *
 * The final error is DispatchFailure, or Timeout when the last attempt timed out.
 */
class RetryingDispatcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryingDispatcher(DispatchTransport& transport, Sleeper sleeper = {});

    Result<DispatchReceipt> dispatch(const DispatchRequest& request, const RetryConfig& cfg);

private:
    DispatchTransport& transport_;
    Sleeper            sleeper_;
};

} // namespace remedy::dispatch
