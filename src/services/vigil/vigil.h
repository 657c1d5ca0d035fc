/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_VIGILD_H_
#define VIGIL_VIGILD_H_

#include <daemon.h>
#include <vigil_config.h>
#include <watchdog.h>
#include <memory>
#include <string>

// daemon name and description
constexpr const char *DAEMON_TYPE = "vigild";
constexpr const char *DAEMON_ID = "watchdog";
constexpr const char *DAEMON_DESCRIPTION = "VIGIL system management watchdog";

// watchdog daemon descriptor definition
class VigildDescriptor : public vigil::DaemonDescriptor {
public:
    VigildDescriptor(const char *_type, const char *_id, const char *_desc);
    VigildDescriptor(const VigildDescriptor &o) = delete;
    VigildDescriptor &operator=(const VigildDescriptor &o) = delete;
    ~VigildDescriptor() override;

    void process_args(int argc, char **argv) override;
    void print_help() override;
    void signal_handler(int signum) override;
    void terminate() override;

    /**
     * Load configuration file and apply command line overrides
     * @return  0 for success, 1 if configuration is invalid
     */
    int init_config();

    /**
     * Write PID file (if configured)
     * @return  0 for success, 1 if error occurred
     */
    int init_pid_file();

    /**
     * Create watchdog
     */
    void init();

    /**
     * Supervise daemons until terminated
     * @return  Exit code
     */
    int run();

    // detach from terminal
    bool detach = false;

private:
    // config file
    std::string config_file;
    // --daemons
    std::string daemons_arg;
    // --bindir
    std::string bindir_arg;
    // -p
    std::string pid_file_arg;
    // --no-check-running
    bool no_check_running = false;
    // -D
    bool debug = false;
    // pid file written
    bool pid_file_written = false;
    // effective config
    vigil::WatchdogConfig cfg;
    // watchdog
    std::unique_ptr<vigil::Watchdog> wdog;
};

#endif /* VIGIL_VIGILD_H_ */
