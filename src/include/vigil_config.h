/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_CONFIG_H_
#define VIGIL_CONFIG_H_

#include <chrono>
#include <string>
#include <vector>
#include <json_rpc.h>
#include <process.h>
#include <restart_policy.h>

namespace vigil {
    /**
     * Supervised daemon kind
     */
    enum DaemonKind {
        DK_BROKER   = 0,
        DK_MONITOR  = 1,
        DK_MANAGER  = 2
    };

    /**
     * Static daemon descriptor
     */
    struct DaemonKindInfo {
        DaemonKind kind;
        const char *name;
        /** daemons that must be running before this one is started */
        std::vector<DaemonKind> depends_on;
    };

    /**
     * Get static descriptor table (broker, monitor, manager)
     * @return  Descriptor table
     */
    const std::vector<DaemonKindInfo> &daemon_kinds();

    /**
     * Find daemon kind by name
     * @param[in]   name    Daemon name
     * @param[out]  kind    Daemon kind
     * @return      0 for success, 1 if unknown
     */
    int daemon_kind_from_name(const std::string &name, DaemonKind &kind);

    /**
     * Get daemon name
     * @param[in]   kind    Daemon kind
     * @return      Name C string
     */
    const char *daemon_kind_name(DaemonKind kind);

    /**
     * Supervised daemon definition
     */
    struct DaemonSpec {
        DaemonKind kind = DK_BROKER;
        std::string name;
        std::string executable;
        std::vector<std::string> args;
        EnvMap env;
        std::string socket_path;
        std::vector<DaemonKind> depends_on;
    };

    /**
     * Supervisor timing parameters
     */
    struct SupervisorConfig {
        /** ping interval while running */
        std::chrono::milliseconds poll_interval{5000};
        /** ping interval while waiting for first ack */
        std::chrono::milliseconds startup_poll_interval{500};
        /** ping reply timeout */
        std::chrono::milliseconds ping_timeout{2000};
        /** consecutive ping failures before daemon is unresponsive */
        unsigned int ping_failure_threshold = 2;
        /** time allowed between spawn and first ack */
        std::chrono::milliseconds startup_timeout{30000};
        /** SIGTERM -> SIGKILL escalation delay */
        std::chrono::milliseconds grace_period{10000};
        /** healthy period after which restart counter is reset */
        std::chrono::milliseconds stability_window{60000};
    };

    /**
     * Watchdog configuration
     */
    struct WatchdogConfig {
        std::string log_level = "info";
        std::string data_path = "/var/lib/vigil";
        std::string sockets_path;
        std::string bindir = "/usr/lib/vigil";
        std::string pid_file;
        bool check_running = true;
        bool shutdown_on_failure = false;
        SupervisorConfig supervisor;
        RestartConfig restart;
        /** daemons in dependency order */
        std::vector<DaemonSpec> daemons;
        /** all known definitions, including disabled ones */
        std::vector<DaemonSpec> available;

        /**
         * Build configuration from JSON document
         * @param[in]   j   JSON document
         * @return      Configuration
         * @throw       std::invalid_argument   invalid configuration
         */
        static WatchdogConfig from_json(const json &j);

        /**
         * Load configuration from JSON file
         * @param[in]   path    Path to file
         * @return      Configuration
         * @throw       std::invalid_argument   unreadable or invalid file
         */
        static WatchdogConfig from_file(const std::string &path);

        /**
         * Default configuration (all daemons enabled)
         * @return      Configuration
         */
        static WatchdogConfig defaults();

        /**
         * Restrict to listed daemons, dependencies are added implicitly
         * @param[in]   names   Daemon names
         * @throw       std::invalid_argument   unknown daemon name
         */
        void select_daemons(const std::vector<std::string> &names);

        /**
         * Change bindir and update default executable paths
         * @param[in]   _bindir     Directory with daemon executables
         */
        void set_bindir(const std::string &_bindir);

        /**
         * Find daemon definition
         * @param[in]   kind    Daemon kind
         * @return      Pointer to definition or nullptr
         */
        const DaemonSpec *find(DaemonKind kind) const;
    };
}

#endif /* VIGIL_CONFIG_H_ */
