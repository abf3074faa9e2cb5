#pragma once
/**
 * @file rule_engine.hpp
 * @brief Operator-defined rules that adjust or suppress remediation per incident.
 * @details Rules are evaluated after deduplication and before routing. They
 *          can rewrite severity, attach metadata, override the target
 *          repository, or skip remediation entirely.
 */

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "remedy/error.hpp"
#include "remedy/incident/incident.hpp"

namespace remedy::routing {

/** @struct RuleConditions
 *  @brief Every present condition must hold for the rule to match.
 */
struct RuleConditions {
    std::optional<std::string> service_name;   ///< Exact match
    std::optional<std::string> error_pattern;  ///< ECMAScript regex, searched in error_message
    std::optional<std::string> severity;       ///< Exact match
    std::optional<std::string> provider;       ///< Exact match
    std::map<std::string, std::string> metadata; ///< Keys that must exist in provider_data with equal value
};

/** @struct RuleActions
 *  @brief Effects applied when a rule matches.
 */
struct RuleActions {
    std::optional<std::string> set_severity;
    std::map<std::string, std::string> add_metadata;
    std::optional<std::string> set_repository;
    bool skip_remediation{false};
};

/** @struct CustomRule */
struct CustomRule {
    std::string    name;
    std::string    description;
    RuleConditions conditions;
    RuleActions    actions;
    bool           enabled{true};
};

/** @struct RuleMatch
 *  @brief A matched rule (by name) and the actions it carries.
 */
struct RuleMatch {
    std::string rule_name;
    RuleActions actions;
};

/// Name required, regex compiles, severities in the known set.
Result<void> validate_rule(const CustomRule& rule);

/** @class RuleEngine
 *  @brief Immutable set of enabled rules with precompiled patterns. Safe for concurrent readers.
 */
class RuleEngine {
public:
    RuleEngine() = default;

    /// Keeps enabled rules only. Rules whose pattern fails to compile never match.
    explicit RuleEngine(const std::vector<CustomRule>& rules);

    /// Matching rules in declaration order.
    [[nodiscard]] std::vector<RuleMatch> evaluate(const incident::Incident& in) const;

    /// Apply severity and metadata actions in match order (later severity wins).
    static void apply_actions(incident::Incident& in, const std::vector<RuleMatch>& matches);

    /// Any match asks to skip remediation.
    static bool should_skip_remediation(const std::vector<RuleMatch>& matches) noexcept;

    /// First match that sets a repository.
    static std::optional<std::string> repository_override(const std::vector<RuleMatch>& matches);

    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

private:
    struct Compiled {
        CustomRule                rule;
        std::optional<std::regex> pattern;
        bool                      pattern_ok{true};
    };

    static bool matches(const Compiled& c, const incident::Incident& in);

    std::vector<Compiled> rules_;
};

} // namespace remedy::routing
