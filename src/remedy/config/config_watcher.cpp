#include "remedy/config/config_watcher.hpp"

#include <exception>
#include <system_error>

#include "remedy/obs/observability.hpp"

namespace remedy::config {

    ConfigWatcher::ConfigWatcher(std::string path, OrchestratorConfig initial)
        : path_(std::move(path)),
          current_(std::make_shared<const OrchestratorConfig>(std::move(initial))) {
        std::error_code ec;
        last_write_ = std::filesystem::last_write_time(path_, ec);
        if (ec) obs::logger()->warn("config watcher cannot stat path={} error={}", path_, ec.message());
    }

    ConfigWatcher::~ConfigWatcher() {
        stop();
    }

    std::shared_ptr<const OrchestratorConfig> ConfigWatcher::current() const {
        std::lock_guard<std::mutex> lk(mu_);
        return current_;
    }

    void ConfigWatcher::on_reload(Callback cb) {
        std::lock_guard<std::mutex> lk(mu_);
        callbacks_.push_back(std::move(cb));
    }

    Result<bool> ConfigWatcher::check_and_reload() {
        std::error_code ec;
        const auto stamp = std::filesystem::last_write_time(path_, ec);
        if (ec) return make_error(ErrorCode::Config, "cannot stat config " + path_ + ": " + ec.message());

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stamp == last_write_) return false;
        }

        auto loaded = Loader::load_from_file(path_);
        if (!loaded) {
            // A rejected file is reported once per modification.
            std::lock_guard<std::mutex> lk(mu_);
            last_write_ = stamp;
            return forward_error(loaded.error());
        }

        auto snapshot = std::make_shared<const OrchestratorConfig>(std::move(*loaded));
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lk(mu_);
            current_ = snapshot;
            last_write_ = stamp;
            callbacks = callbacks_;
        }

        obs::logger()->info("configuration reloaded path={} mappings={} rules={}",
                            path_, snapshot->service_mappings.size(), snapshot->custom_rules.size());
        for (const auto& cb : callbacks) {
            try {
                cb(*snapshot);
            } catch (const std::exception& e) {
                obs::logger()->error("configuration reload callback failed path={} error={}", path_, e.what());
            }
        }
        return true;
    }

    void ConfigWatcher::start(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lk(run_mu_);
        if (worker_.joinable()) return;
        stopping_ = false;
        worker_ = std::thread([this, interval] { run(interval); });
    }

    void ConfigWatcher::stop() {
        {
            std::lock_guard<std::mutex> lk(run_mu_);
            stopping_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
    }

    void ConfigWatcher::run(std::chrono::milliseconds interval) {
        std::unique_lock<std::mutex> lk(run_mu_);
        while (!cv_.wait_for(lk, interval, [this] { return stopping_; })) {
            lk.unlock();
            if (auto r = check_and_reload(); !r) {
                obs::logger()->error("configuration reload rejected path={} error={}",
                                     path_, r.error().message);
            }
            lk.lock();
        }
    }

} // namespace remedy::config
