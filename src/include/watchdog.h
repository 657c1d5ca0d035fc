/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_WATCHDOG_H_
#define VIGIL_WATCHDOG_H_

#include <atomic>
#include <memory>
#include <vector>
#include <json_rpc.h>
#include <ping.h>
#include <supervisor.h>
#include <vigil_config.h>

namespace vigil {
    /**
     * Supervisor of the daemon set (broker, monitor, manager)
     */
    class Watchdog {
    public:
        /**
         * Create one supervisor per configured daemon
         * @param[in]   _cfg        Watchdog configuration
         * @param[in]   _pinger     Liveness probe (LocalPingChannel if nullptr)
         */
        explicit Watchdog(const WatchdogConfig &_cfg,
                          std::shared_ptr<PingChannel> _pinger = nullptr);
        Watchdog(const Watchdog &o) = delete;
        Watchdog &operator=(const Watchdog &o) = delete;
        ~Watchdog();

        /**
         * Start daemons in dependency order and supervise them until
         * shutdown is requested
         * @return  Process exit code (vigil::error::ExitCode)
         */
        int run();

        /**
         * Request orderly shutdown (async-signal-safe)
         */
        void request_shutdown();

        /**
         * Request SIGUSR1 forwarding to daemons (async-signal-safe)
         */
        void request_log_rotation();

        /**
         * Set event callback for all supervisors (set before run)
         * @param[in]   cb      Callback or nullptr
         */
        void set_callback(SupervisorCallback *cb);

        /**
         * Get daemon state
         * @param[in]   kind    Daemon kind
         * @return      Supervisor state, SS_STOPPED if not configured
         */
        SupervisorState status(DaemonKind kind) const;

        /**
         * Get daemon statistics
         * @param[in]   kind    Daemon kind
         * @return      Statistics snapshot
         */
        SupervisorStats stats(DaemonKind kind) const;

        /**
         * Aggregated health document
         * @return      JSON object with per daemon state
         */
        json health() const;

        /**
         * Startup levels (indexes into configured daemons); level 0
         * has no dependencies, level n depends on level n - 1
         * @return      Startup levels
         */
        const std::vector<std::vector<std::size_t>> &get_levels() const;

    private:
        enum StartResult {
            STR_OK          = 0,
            STR_FAILED      = 1,
            STR_SHUTDOWN    = 2
        };

        int check_running();
        StartResult wait_running(const std::vector<std::size_t> &level);
        int stop_all();
        bool any_failed() const;

        /** configuration */
        const WatchdogConfig cfg;
        /** liveness probe shared by all supervisors */
        std::shared_ptr<PingChannel> pinger;
        /** supervisors, same order as cfg.daemons */
        std::vector<std::unique_ptr<DaemonSupervisor>> sups;
        /** startup levels */
        std::vector<std::vector<std::size_t>> levels;
        /** shutdown flag */
        std::atomic<bool> shutdown_requested{false};
        /** log rotation flag */
        std::atomic<bool> log_rotation_requested{false};
    };
}

#endif /* VIGIL_WATCHDOG_H_ */
