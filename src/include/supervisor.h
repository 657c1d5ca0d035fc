/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_SUPERVISOR_H_
#define VIGIL_SUPERVISOR_H_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <ping.h>
#include <process.h>
#include <restart_policy.h>
#include <vigil_config.h>

namespace vigil {
    /**
     * Supervisor state
     */
    enum SupervisorState {
        SS_STOPPED              = 0,
        SS_STARTING             = 1,
        SS_RUNNING              = 2,
        SS_RESTARTING           = 3,
        SS_FAILED_PERMANENTLY   = 4,
        SS_STOPPING             = 5
    };

    /**
     * Get state name
     * @param[in]   state   Supervisor state
     * @return      State name C string
     */
    const char *supervisor_state_str(SupervisorState state);

    /**
     * Supervisor event type
     */
    enum SupervisorEventType {
        SET_SPAWNED         = 0,
        SET_RUNNING         = 1,
        SET_EXITED          = 2,
        SET_UNRESPONSIVE    = 3,
        SET_RESTARTING      = 4,
        SET_FAILED          = 5,
        SET_STOPPED         = 6
    };

    /**
     * Supervisor event
     */
    struct SupervisorEvent {
        SupervisorEventType type;
        DaemonKind kind;
        const std::string *name;
        pid_t pid;
        steady_clock::time_point ts;
    };

    /**
     * Supervisor event callback; called from monitor
     * thread or from stop() caller
     */
    class SupervisorCallback {
    public:
        SupervisorCallback() = default;
        SupervisorCallback(const SupervisorCallback &o) = delete;
        SupervisorCallback &operator=(const SupervisorCallback &o) = delete;
        virtual ~SupervisorCallback() = default;

        virtual void run(const SupervisorEvent &ev) = 0;
    };

    /**
     * Supervisor statistics snapshot
     */
    struct SupervisorStats {
        SupervisorState state = SS_STOPPED;
        pid_t pid = 0;
        uint64_t spawns = 0;
        uint64_t restarts = 0;
        unsigned int failures = 0;
        unsigned int ping_failures = 0;
        ExitStatus last_exit;
        /** start time of current child, valid if pid != 0 */
        std::chrono::system_clock::time_point started;
    };

    /**
     * Supervisor of a single daemon process
     */
    class DaemonSupervisor {
    public:
        DaemonSupervisor(const DaemonSpec &_spec,
                         const SupervisorConfig &_cfg,
                         const RestartConfig &_rcfg,
                         std::shared_ptr<PingChannel> _pinger);
        DaemonSupervisor(const DaemonSupervisor &o) = delete;
        DaemonSupervisor &operator=(const DaemonSupervisor &o) = delete;
        ~DaemonSupervisor();

        /**
         * Spawn daemon and start monitor loop; no-op if already
         * starting or running. Resets restart counter if daemon
         * has failed permanently.
         * @return  0 for success
         */
        int start();

        /**
         * Stop monitor loop and terminate daemon (graceful, then
         * forceful after grace period). Always ends in SS_STOPPED.
         * @return  0 for success
         */
        int stop();

        /**
         * Get current state
         * @return  Supervisor state
         */
        SupervisorState status() const;

        /**
         * Get statistics snapshot
         * @return  Statistics
         */
        SupervisorStats stats() const;

        /**
         * Deliver signal to running daemon
         * @param[in]   kind    Signal kind
         * @return      0 for success, 1 if no live process
         */
        int forward_signal(SignalKind kind);

        /**
         * Set event callback (set before start)
         * @param[in]   _cb     Callback or nullptr
         */
        void set_callback(SupervisorCallback *_cb);

        const DaemonSpec &get_spec() const;

    private:
        enum WaitResult {
            WR_TIMEOUT = 0,
            WR_STOP    = 1
        };

        void monitor_loop();
        bool spawn_child();
        bool check_child();
        bool handle_failure(const char *reason);
        void terminate_child();
        WaitResult wait_for(std::chrono::milliseconds d);
        void emit(SupervisorEventType type, pid_t pid);

        /** daemon definition */
        const DaemonSpec spec;
        /** timing */
        const SupervisorConfig cfg;
        /** restart policy */
        RestartPolicy policy;
        /** liveness probe */
        std::shared_ptr<PingChannel> pinger;
        /** event callback */
        SupervisorCallback *cb = nullptr;

        /** state lock */
        mutable std::mutex mtx;
        /** stop wakeup */
        std::condition_variable cv;
        SupervisorState state = SS_STOPPED;
        bool stop_requested = false;
        RestartCounter counter;
        SupervisorStats st;

        /** process handle lock */
        mutable std::mutex handle_mtx;
        std::unique_ptr<ProcessHandle> handle;

        /** serializes start/stop */
        std::mutex ctrl_mtx;
        /** monitor thread */
        std::thread th;

        /** loop local state (monitor thread only) */
        steady_clock::time_point spawn_ts;
        steady_clock::time_point healthy_since;
        bool healthy = false;
    };
}

#endif /* VIGIL_SUPERVISOR_H_ */
