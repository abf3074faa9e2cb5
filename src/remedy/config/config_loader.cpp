/**
 * @file config_loader.cpp
 * @brief JSON loader: env expansion, duration parsing, validation.
 */
#include "remedy/config/config_loader.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace remedy::config {

    using namespace remedy::config::constants;

    namespace {

        std::optional<std::string> opt_string(const nlohmann::json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return std::nullopt;
            return it->get<std::string>();
        }

        std::map<std::string, std::string> string_map(const nlohmann::json& j, const char* key) {
            std::map<std::string, std::string> out;
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return out;
            for (const auto& [k, v] : it->items()) {
                out.emplace(k, v.is_string() ? v.get<std::string>() : v.dump());
            }
            return out;
        }

        // Durations are either strings ("5m") or integer milliseconds.
        Result<std::chrono::milliseconds> duration_field(const nlohmann::json& j, const char* key,
                                                         std::chrono::milliseconds fallback) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return fallback;
            if (it->is_number_integer()) return std::chrono::milliseconds{it->get<int64_t>()};
            if (it->is_string()) {
                auto d = parse_duration(it->get_ref<const std::string&>());
                if (!d) return make_error(ErrorCode::Config, std::string(key) + ": " + d.error().message);
                return *d;
            }
            return make_error(ErrorCode::Config, std::string(key) + " must be a duration string or milliseconds");
        }

        routing::CustomRule parse_rule(const nlohmann::json& j) {
            routing::CustomRule r;
            r.name        = j.value("name", std::string{});
            r.description = j.value("description", std::string{});
            r.enabled     = j.value("enabled", true);
            if (auto c = j.find("conditions"); c != j.end() && c->is_object()) {
                r.conditions.service_name  = opt_string(*c, "service_name");
                r.conditions.error_pattern = opt_string(*c, "error_pattern");
                r.conditions.severity      = opt_string(*c, "severity");
                r.conditions.provider      = opt_string(*c, "provider");
                r.conditions.metadata      = string_map(*c, "metadata");
            }
            if (auto a = j.find("actions"); a != j.end() && a->is_object()) {
                r.actions.set_severity     = opt_string(*a, "set_severity");
                r.actions.add_metadata     = string_map(*a, "add_metadata");
                r.actions.set_repository   = opt_string(*a, "set_repository");
                r.actions.skip_remediation = a->value("skip_remediation", false);
            }
            return r;
        }

    } // namespace

    uint32_t ConcurrencyConfig::limit_for(std::string_view repository) const {
        for (const auto& [repo, limit] : per_repository) {
            if (repo == repository) return limit;
        }
        return max_workflows_per_repo;
    }

    Result<std::chrono::milliseconds> parse_duration(std::string_view text) {
        std::size_t i = 0;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        const std::size_t digits_begin = i;
        uint64_t amount = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            amount = amount * 10 + static_cast<uint64_t>(text[i] - '0');
            if (amount > std::numeric_limits<uint32_t>::max())
                return make_error(ErrorCode::Config, "duration out of range: " + std::string(text));
            ++i;
        }
        if (i == digits_begin)
            return make_error(ErrorCode::Config, "duration needs a leading number: " + std::string(text));

        std::string_view unit = text.substr(i);
        while (!unit.empty() && std::isspace(static_cast<unsigned char>(unit.back()))) unit.remove_suffix(1);

        using namespace std::chrono;
        const auto n = static_cast<int64_t>(amount);
        if (unit == "ms") return milliseconds{n};
        if (unit == "s")  return duration_cast<milliseconds>(seconds{n});
        if (unit == "m")  return duration_cast<milliseconds>(minutes{n});
        if (unit == "h")  return duration_cast<milliseconds>(hours{n});
        return make_error(ErrorCode::Config, "unknown duration unit in '" + std::string(text) + "'");
    }

    std::string expand_env(std::string_view text) {
        static const std::regex pattern(R"(\$\{([^}:]+)(:-([^}]*))?\})");

        std::string in(text);
        std::string out;
        out.reserve(in.size());
        auto last = in.cbegin();
        for (std::sregex_iterator it(in.cbegin(), in.cend(), pattern), end; it != end; ++it) {
            const auto& m = *it;
            out.append(last, m[0].first);
            const std::string name = m[1].str();
            const char* value = std::getenv(name.c_str());
            if (value && *value) out.append(value);
            else if (m[3].matched) out.append(m[3].str());
            last = m[0].second;
        }
        out.append(last, in.cend());
        return out;
    }

    Result<void> validate(const OrchestratorConfig& cfg) {
        if (const auto err = routing::RoutingTable::validate(cfg.service_mappings);
            err != routing::RoutingErr::Ok) {
            return make_error(ErrorCode::Config,
                              std::string("invalid service_mappings: ") + routing::to_string(err));
        }
        if (cfg.concurrency.max_workflows_per_repo == 0)
            return make_error(ErrorCode::Config, "concurrency.max_workflows_per_repo must be >= 1");
        for (const auto& [repo, limit] : cfg.concurrency.per_repository) {
            if (limit == 0)
                return make_error(ErrorCode::Config, "concurrency limit for " + repo + " must be >= 1");
        }
        if (cfg.retry.max_attempts == 0)
            return make_error(ErrorCode::Config, "retry.max_attempts must be >= 1");
        if (cfg.retry.dispatch_timeout.count() <= 0)
            return make_error(ErrorCode::Config, "retry.dispatch_timeout must be positive");
        if (cfg.retry.base_delay.count() < 0)
            return make_error(ErrorCode::Config, "retry.base_delay must not be negative");
        if (cfg.dedup.time_window.count() < 0)
            return make_error(ErrorCode::Config, "deduplication.time_window must not be negative");
        if (cfg.github.workflow_name.empty())
            return make_error(ErrorCode::Config, "github.workflow_name is required");

        for (std::size_t i = 0; i < cfg.custom_rules.size(); ++i) {
            if (auto r = routing::validate_rule(cfg.custom_rules[i]); !r) {
                return make_error(ErrorCode::Config, "invalid custom rule at index " +
                                                     std::to_string(i) + ": " + r.error().message);
            }
        }
        return {};
    }

    OrchestratorConfig Loader::defaults() {
        return OrchestratorConfig{};
    }

    Result<OrchestratorConfig> Loader::from_json(const nlohmann::json& j) {
        if (!j.is_object()) return make_error(ErrorCode::Config, "configuration root must be an object");

        OrchestratorConfig cfg = defaults();
        try {
            cfg.log_level = j.value("log_level", std::string(DEFAULT_LOG_LEVEL));

            if (auto g = j.find("github"); g != j.end() && g->is_object()) {
                cfg.github.workflow_name  = g->value("workflow_name", std::string(DEFAULT_WORKFLOW));
                cfg.github.default_branch = g->value("default_branch", std::string(DEFAULT_BRANCH));
            }

            if (auto m = j.find("service_mappings"); m != j.end() && m->is_array()) {
                for (const auto& e : *m) {
                    cfg.service_mappings.push_back(routing::ServiceMapping{
                        .service_name = e.value("service_name", std::string{}),
                        .repository   = e.value("repository", std::string{}),
                        .branch       = e.value("branch", std::string{}),
                    });
                }
            }

            if (auto d = j.find("deduplication"); d != j.end() && d->is_object()) {
                auto w = duration_field(*d, "time_window", cfg.dedup.time_window);
                if (!w) return forward_error(w.error());
                cfg.dedup.time_window = *w;
            }

            if (auto c = j.find("concurrency"); c != j.end() && c->is_object()) {
                cfg.concurrency.max_workflows_per_repo =
                    c->value("max_workflows_per_repo", MAX_WORKFLOWS_PER_REPO);
                if (auto p = c->find("per_repository"); p != c->end() && p->is_object()) {
                    for (const auto& [repo, limit] : p->items()) {
                        cfg.concurrency.per_repository[repo] = limit.get<uint32_t>();
                    }
                }
            }

            if (auto r = j.find("retry"); r != j.end() && r->is_object()) {
                cfg.retry.max_attempts = r->value("max_attempts", DISPATCH_MAX_ATTEMPTS);
                auto base = duration_field(*r, "base_delay", cfg.retry.base_delay);
                if (!base) return forward_error(base.error());
                cfg.retry.base_delay = *base;
                auto timeout = duration_field(*r, "dispatch_timeout", cfg.retry.dispatch_timeout);
                if (!timeout) return forward_error(timeout.error());
                cfg.retry.dispatch_timeout = *timeout;
                auto cap = duration_field(*r, "max_delay", cfg.retry.max_delay);
                if (!cap) return forward_error(cap.error());
                cfg.retry.max_delay = *cap;
            }

            if (auto rules = j.find("custom_rules"); rules != j.end() && rules->is_array()) {
                for (const auto& e : *rules) cfg.custom_rules.push_back(parse_rule(e));
            }
        } catch (const nlohmann::json::exception& e) {
            return make_error(ErrorCode::Config, std::string("failed to parse config: ") + e.what());
        }

        if (auto v = validate(cfg); !v) {
            return make_error(ErrorCode::Config, "invalid configuration: " + v.error().message);
        }
        return cfg;
    }

    Result<OrchestratorConfig> Loader::load_from_string(std::string_view text) {
        const std::string expanded = expand_env(text);
        nlohmann::json j = nlohmann::json::parse(expanded, nullptr, /*allow_exceptions=*/false,
                                                 /*ignore_comments=*/true);
        if (j.is_discarded()) return make_error(ErrorCode::Config, "failed to parse config: malformed JSON");
        return from_json(j);
    }

    Result<OrchestratorConfig> Loader::load_from_file(const std::string& path) {
        std::ifstream f(path);
        if (!f) return make_error(ErrorCode::Config, "failed to read config file: " + path);
        std::ostringstream ss;
        ss << f.rdbuf();
        return load_from_string(ss.str());
    }

} // namespace remedy::config
