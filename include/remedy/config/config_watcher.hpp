#pragma once
/**
 * @file config_watcher.hpp
 * @brief Hot reload of the JSON configuration by polling its modification time.
 *
 * The watcher owns the current configuration as an immutable snapshot. A
 * reload that fails to parse or validate is logged and the previous snapshot
 * stays active. Callbacks run on the polling thread, outside the lock.
 */

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "remedy/config/config_loader.hpp"
#include "remedy/config/constants.hpp"
#include "remedy/error.hpp"

namespace remedy::config {

    class ConfigWatcher {
    public:
        using Callback = std::function<void(const OrchestratorConfig&)>;

        /// `initial` is the configuration already loaded from `path`.
        ConfigWatcher(std::string path, OrchestratorConfig initial);
        ~ConfigWatcher();

        ConfigWatcher(const ConfigWatcher&) = delete;
        ConfigWatcher& operator=(const ConfigWatcher&) = delete;

        /// Current snapshot.
        [[nodiscard]] std::shared_ptr<const OrchestratorConfig> current() const;

        /// Register a callback invoked after every successful reload.
        void on_reload(Callback cb);

        /**
         * @brief Reload if the file changed since the last successful check.
         * @return true when a new configuration was published, false when unchanged,
         *         ErrorCode::Config when the new file was rejected.
         */
        Result<bool> check_and_reload();

        /// Start the polling thread (no-op when already running).
        void start(std::chrono::milliseconds interval =
                       std::chrono::milliseconds{constants::CONFIG_POLL_INTERVAL_MS});

        /// Stop and join the polling thread.
        void stop();

    private:
        void run(std::chrono::milliseconds interval);

        const std::string path_;

        mutable std::mutex mu_;
        std::shared_ptr<const OrchestratorConfig> current_;
        std::vector<Callback> callbacks_;
        std::filesystem::file_time_type last_write_{};

        std::mutex run_mu_;
        std::condition_variable cv_;
        bool stopping_{false};
        std::thread worker_;
    };

} // namespace remedy::config
