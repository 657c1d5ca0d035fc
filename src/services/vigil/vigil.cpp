/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <getopt.h>
#include <vigil.h>
#include <vigil_err_codes.h>
#include <vigil_utils.h>
#include <stdexcept>

using namespace vigil::error;

VigildDescriptor::VigildDescriptor(const char *_type,
                                   const char *_id,
                                   const char *_desc)
    : vigil::DaemonDescriptor(_type, _id, _desc),
      cfg(vigil::WatchdogConfig::defaults()) {}

VigildDescriptor::~VigildDescriptor() = default;

void VigildDescriptor::process_args(int argc, char **argv) {
    int option_index = 0;
    struct option long_options[] = {{"daemons", required_argument, 0, 0},
                                    {"bindir", required_argument, 0, 0},
                                    {"no-check-running", no_argument, 0, 0},
                                    {0, 0, 0, 0}};

    int opt;
    while ((opt = getopt_long(argc, argv, "?c:i:dp:D", long_options,
                              &option_index)) != -1) {
        switch (opt) {
        // long options
        case 0:
            if (long_options[option_index].flag != 0)
                break;
            switch (option_index) {
            // daemons
            case 0:
                daemons_arg.assign(optarg);
                break;

            // bindir
            case 1:
                bindir_arg.assign(optarg);
                break;

            // no-check-running
            case 2:
                no_check_running = true;
                break;

            default:
                break;
            }
            break;

        // help
        case '?':
            print_help();
            exit(EXIT_CONFIG_ERROR);

        // config file
        case 'c':
            config_file.assign(optarg);
            break;

        // daemon id
        case 'i':
            if (set_daemon_id(optarg) > 0) {
                std::cout << "ERROR: Maximum size of daemon id string is "
                             "15 characters!"
                          << std::endl;
                exit(EXIT_CONFIG_ERROR);
            }
            break;

        // detach
        case 'd':
            detach = true;
            break;

        // pid file
        case 'p':
            pid_file_arg.assign(optarg);
            break;

        // debug mode
        case 'D':
            debug = true;
            break;

        default:
            break;
        }
    }
}

void VigildDescriptor::print_help() {
    std::cout << daemon_type << " - " << daemon_description << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << " -?\thelp" << std::endl;
    std::cout << " -c\tconfiguration file (JSON)" << std::endl;
    std::cout << " -i\tdaemon id\t\t(default = watchdog)" << std::endl;
    std::cout << " -d\tdetach from terminal" << std::endl;
    std::cout << " -p\tPID file" << std::endl;
    std::cout << " -D\tstart in debug mode" << std::endl;
    std::cout << std::endl;
    std::cout << "Watchdog Options:" << std::endl;
    std::cout << "=================" << std::endl;
    std::cout << " --daemons\t\tcomma separated list of daemons\t(default = "
                 "broker,monitor,manager)"
              << std::endl;
    std::cout << " --bindir\t\tdaemon executables directory\t(default = "
                 "/usr/lib/vigil)"
              << std::endl;
    std::cout << " --no-check-running\tdo not check for running daemons"
              << std::endl;
}

int VigildDescriptor::init_config() {
    try {
        // config file or defaults
        if (!config_file.empty())
            cfg = vigil::WatchdogConfig::from_file(config_file);

        // command line overrides
        if (!bindir_arg.empty()) cfg.set_bindir(bindir_arg);
        if (!daemons_arg.empty())
            cfg.select_daemons(vigil_utils::tokenize(daemons_arg, ','));
        if (no_check_running) cfg.check_running = false;
        if (!pid_file_arg.empty()) cfg.pid_file = pid_file_arg;
        if (debug) cfg.log_level = "debug";

    } catch (std::invalid_argument &e) {
        std::cout << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // log level
    if (cfg.log_level == "debug")
        set_log_level(vigil::LLT_DEBUG);
    else if (cfg.log_level == "warning")
        set_log_level(vigil::LLT_WARNING);
    else if (cfg.log_level == "error")
        set_log_level(vigil::LLT_ERROR);
    else
        set_log_level(vigil::LLT_INFO);

    // copy to stderr in foreground debug mode
    set_log_stderr(debug && !detach);
    return 0;
}

int VigildDescriptor::init_pid_file() {
    if (cfg.pid_file.empty()) return 0;
    if (vigil_utils::write_pid_file(cfg.pid_file)) {
        log(vigil::LLT_ERROR, "cannot write PID file [%s]", cfg.pid_file.c_str());
        return 1;
    }
    pid_file_written = true;
    return 0;
}

void VigildDescriptor::init() {
    for (auto &d : cfg.daemons) {
        log(vigil::LLT_DEBUG,
            "daemon [%s], executable [%s], socket [%s]",
            d.name.c_str(),
            d.executable.c_str(),
            d.socket_path.c_str());
    }
    wdog.reset(new vigil::Watchdog(cfg));
}

int VigildDescriptor::run() {
    if (!wdog) return EXIT_CONFIG_ERROR;
    return wdog->run();
}

void VigildDescriptor::signal_handler(int signum) {
    switch (signum) {
        case SIGTERM:
        case SIGINT:
            if (wdog) wdog->request_shutdown();
            break;

        case SIGUSR1:
            if (wdog) wdog->request_log_rotation();
            break;

        default:
            break;
    }
}

void VigildDescriptor::terminate() {
    // remove PID file
    if (pid_file_written && unlink(cfg.pid_file.c_str()) != 0) {
        log(vigil::LLT_WARNING, "cannot remove PID file [%s]", cfg.pid_file.c_str());
    }
    pid_file_written = false;
}
