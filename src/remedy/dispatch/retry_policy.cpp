#include "remedy/dispatch/retry_policy.hpp"

#include <algorithm>
#include <thread>

#include "remedy/obs/observability.hpp"

namespace remedy::dispatch {

std::chrono::milliseconds backoff_for(const RetryConfig& cfg, uint32_t attempt) noexcept {
    if (attempt == 0) return std::chrono::milliseconds{0};
    // Clamp the shift so the multiplication cannot overflow.
    const uint32_t shift = std::min<uint32_t>(attempt - 1, 20);
    const auto delay = cfg.base_delay * (int64_t{1} << shift);
    return std::min(delay, cfg.max_delay);
}

RetryingDispatcher::RetryingDispatcher(DispatchTransport& transport, Sleeper sleeper)
    : transport_(transport), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

Result<DispatchReceipt> RetryingDispatcher::dispatch(const DispatchRequest& request,
                                                     const RetryConfig& cfg) {
    const uint32_t attempts = std::max<uint32_t>(cfg.max_attempts, 1);
    Error last{ErrorCode::DispatchFailure, "no attempt made"};

    for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
        if (const auto delay = backoff_for(cfg, attempt); delay.count() > 0) sleeper_(delay);

        auto r = transport_.dispatch(request, cfg.dispatch_timeout);
        if (r) return DispatchReceipt{std::move(*r), attempt + 1};

        last = r.error();
        obs::logger()->warn("dispatch attempt failed incident_id={} repository={} attempt={}/{} error={}",
                            request.incident_id, request.repository, attempt + 1, attempts,
                            last.message);
    }

    const ErrorCode code = last.code == ErrorCode::Timeout ? ErrorCode::Timeout
                                                           : ErrorCode::DispatchFailure;
    return make_error(code, "workflow dispatch failed after " + std::to_string(attempts) +
                            " attempts: " + last.message);
}

} // namespace remedy::dispatch
