#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON configuration loader for the orchestration engine.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "remedy/config/constants.hpp"
#include "remedy/dispatch/retry_policy.hpp"
#include "remedy/error.hpp"
#include "remedy/routing/routing_table.hpp"
#include "remedy/routing/rule_engine.hpp"

namespace remedy::config {

    /** @struct GitHubConfig
     *  @brief Workflow identity used for every dispatch.
     */
    struct GitHubConfig {
        std::string workflow_name{constants::DEFAULT_WORKFLOW};  ///< Workflow file to dispatch
        std::string default_branch{constants::DEFAULT_BRANCH};   ///< Used when a mapping has no branch
    };

    /** @struct DedupConfig */
    struct DedupConfig {
        std::chrono::milliseconds time_window{constants::DEDUP_WINDOW_MS}; ///< Sliding window from now
    };

    /** @struct ConcurrencyConfig
     *  @brief Global default ceiling plus per-repository overrides.
     */
    struct ConcurrencyConfig {
        uint32_t max_workflows_per_repo{constants::MAX_WORKFLOWS_PER_REPO};
        std::unordered_map<std::string, uint32_t> per_repository;

        /// Ceiling that applies to `repository`.
        [[nodiscard]] uint32_t limit_for(std::string_view repository) const;
    };

    /** @struct OrchestratorConfig
     *  @brief Aggregate of sub-configs consumed by the engine. Hot-reloadable as a whole.
     */
    struct OrchestratorConfig {
        std::string                      log_level{constants::DEFAULT_LOG_LEVEL};
        GitHubConfig                     github;
        routing::MappingList             service_mappings;
        DedupConfig                      dedup;
        ConcurrencyConfig                concurrency;
        dispatch::RetryConfig            retry;
        std::vector<routing::CustomRule> custom_rules;
    };

    /**
     * @brief Parse "250ms", "30s", "5m", "1h" (integer amount + unit).
     * @return ErrorCode::Config on malformed input.
     */
    Result<std::chrono::milliseconds> parse_duration(std::string_view text);

    /// Expand ${VAR} and ${VAR:-default}. Unset or empty variables take the default (or "").
    std::string expand_env(std::string_view text);

    /// Semantic checks: mappings, ceilings, retry budget, rules.
    Result<void> validate(const OrchestratorConfig& cfg);

    /** @class Loader
     *  @brief Source of orchestrator configuration (files or in-memory text).
     */
    class Loader {
    public:
        /**
         * @brief Read, env-expand, parse and validate a JSON config file.
         * @param path File path.
         * @return Validated configuration or ErrorCode::Config.
         */
        static Result<OrchestratorConfig> load_from_file(const std::string& path);

        /// Same as load_from_file for already-read text.
        static Result<OrchestratorConfig> load_from_string(std::string_view text);

        /// Map a parsed JSON document onto OrchestratorConfig (no env expansion).
        static Result<OrchestratorConfig> from_json(const nlohmann::json& j);

        /// Built-in defaults (no mappings, no rules).
        static OrchestratorConfig defaults();
    };

} // namespace remedy::config
