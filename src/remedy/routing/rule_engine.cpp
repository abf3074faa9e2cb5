/**
 * @file rule_engine.cpp
 * @brief Implementation of RuleEngine and rule validation.
 */
#include "remedy/routing/rule_engine.hpp"

#include <array>
#include <string_view>

#include "remedy/obs/observability.hpp"

namespace remedy::routing {

namespace {

constexpr std::array<std::string_view, 4> kSeverities{"critical", "high", "medium", "low"};

bool known_severity(std::string_view s) noexcept {
    for (auto v : kSeverities) if (v == s) return true;
    return false;
}

// provider_data values may be any JSON type; strings compare raw, others by dump().
bool metadata_equals(const nlohmann::json& data, const std::string& key, const std::string& want) {
    if (!data.is_object()) return false;
    auto it = data.find(key);
    if (it == data.end()) return false;
    if (it->is_string()) return it->get_ref<const std::string&>() == want;
    return it->dump() == want;
}

} // namespace

Result<void> validate_rule(const CustomRule& rule) {
    if (rule.name.empty()) return make_error(ErrorCode::Config, "rule name is required");

    const auto& pat = rule.conditions.error_pattern;
    if (pat && !pat->empty()) {
        try {
            std::regex re(*pat, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return make_error(ErrorCode::Config, "invalid error_pattern regex in rule '" +
                                                 rule.name + "': " + e.what());
        }
    }
    if (rule.conditions.severity && !known_severity(*rule.conditions.severity)) {
        return make_error(ErrorCode::Config, "invalid severity '" + *rule.conditions.severity +
                                             "' in rule '" + rule.name + "' conditions");
    }
    if (rule.actions.set_severity && !known_severity(*rule.actions.set_severity)) {
        return make_error(ErrorCode::Config, "invalid severity '" + *rule.actions.set_severity +
                                             "' in rule '" + rule.name + "' actions");
    }

    const auto& c = rule.conditions;
    if (!c.service_name && !c.error_pattern && !c.severity && !c.provider && c.metadata.empty()) {
        return make_error(ErrorCode::Config, "rule '" + rule.name + "' must have at least one condition");
    }
    const auto& a = rule.actions;
    if (!a.set_severity && a.add_metadata.empty() && !a.set_repository && !a.skip_remediation) {
        return make_error(ErrorCode::Config, "rule '" + rule.name + "' must have at least one action");
    }
    return {};
}

RuleEngine::RuleEngine(const std::vector<CustomRule>& rules) {
    rules_.reserve(rules.size());
    for (const auto& r : rules) {
        if (!r.enabled) continue;
        Compiled c{.rule = r};
        const auto& pat = r.conditions.error_pattern;
        if (pat && !pat->empty()) {
            try {
                c.pattern.emplace(*pat, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                obs::logger()->warn("rule pattern rejected rule={} error={}", r.name, e.what());
                c.pattern_ok = false;
            }
        }
        rules_.push_back(std::move(c));
    }
}

bool RuleEngine::matches(const Compiled& c, const incident::Incident& in) {
    const auto& cond = c.rule.conditions;
    if (cond.service_name && in.service_name != *cond.service_name) return false;
    if (!c.pattern_ok) return false;
    if (c.pattern && !std::regex_search(in.error_message, *c.pattern)) return false;
    if (cond.severity && in.severity != *cond.severity) return false;
    if (cond.provider && in.provider != *cond.provider) return false;
    for (const auto& [key, value] : cond.metadata) {
        if (!metadata_equals(in.provider_data, key, value)) return false;
    }
    return true;
}

std::vector<RuleMatch> RuleEngine::evaluate(const incident::Incident& in) const {
    std::vector<RuleMatch> out;
    for (const auto& c : rules_) {
        if (matches(c, in)) out.push_back(RuleMatch{c.rule.name, c.rule.actions});
    }
    return out;
}

void RuleEngine::apply_actions(incident::Incident& in, const std::vector<RuleMatch>& matches) {
    if (!in.provider_data.is_object()) in.provider_data = nlohmann::json::object();
    for (const auto& m : matches) {
        if (m.actions.set_severity) in.severity = *m.actions.set_severity;
        for (const auto& [key, value] : m.actions.add_metadata) in.provider_data[key] = value;
    }
}

bool RuleEngine::should_skip_remediation(const std::vector<RuleMatch>& matches) noexcept {
    for (const auto& m : matches) {
        if (m.actions.skip_remediation) return true;
    }
    return false;
}

std::optional<std::string> RuleEngine::repository_override(const std::vector<RuleMatch>& matches) {
    for (const auto& m : matches) {
        if (m.actions.set_repository) return m.actions.set_repository;
    }
    return std::nullopt;
}

} // namespace remedy::routing
