#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the orchestration engine.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) in production deployments.
 */

#include <cstdint>

namespace remedy::config::constants {

// =====================
// Deduplication
// =====================
/// Identical (service, error) pairs collapse within this window.
inline constexpr uint64_t DEDUP_WINDOW_MS = 5ULL * 60ULL * 1000ULL; ///< 5 min

// =====================
// Dispatch concurrency
// =====================
inline constexpr uint32_t MAX_WORKFLOWS_PER_REPO = 2;   ///< Default per-repository ceiling

// =====================
// Dispatch retry
// Backoff before attempt n (n >= 1) is BASE * 2^(n-1).
// =====================
inline constexpr uint32_t DISPATCH_MAX_ATTEMPTS     = 3;      ///< Total attempts, first included
inline constexpr uint32_t DISPATCH_BASE_DELAY_MS    = 1000;   ///< 1 s, doubled per attempt
inline constexpr uint32_t DISPATCH_TIMEOUT_MS       = 30000;  ///< Per-attempt transport deadline
inline constexpr uint32_t DISPATCH_MAX_BACKOFF_MS   = 60000;  ///< Cap for a single backoff sleep

// =====================
// GitHub workflow defaults
// =====================
inline constexpr const char* DEFAULT_BRANCH   = "main";
inline constexpr const char* DEFAULT_WORKFLOW = "remediate.yml";

// =====================
// Config hot reload
// =====================
inline constexpr uint32_t CONFIG_POLL_INTERVAL_MS = 5000; ///< mtime poll period

// =====================
// Logging
// =====================
inline constexpr const char* DEFAULT_LOG_LEVEL = "info";
inline constexpr const char* LOG_PATTERN       = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%l] %v";

} // namespace remedy::config::constants
