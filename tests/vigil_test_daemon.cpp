/*
 * SPDX-License-Identifier: MIT
 *
 */

// Helper daemon for supervision tests: answers pings on its control
// socket and can crash, hang or ignore SIGTERM on request.

#include <getopt.h>
#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <boost/filesystem.hpp>
#include <ping.h>

static volatile sig_atomic_t terminated = 0;
static volatile sig_atomic_t usr1_received = 0;

static void on_signal(int signum) {
    if (signum == SIGUSR1)
        usr1_received = 1;
    else
        terminated = 1;
}

static void print_help() {
    std::cout << "vigil_test_daemon - supervision test helper" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << " --socket\t\tcontrol socket (default = $VIGIL_SOCKET)" << std::endl;
    std::cout << " --exit-after-ms\texit after given time" << std::endl;
    std::cout << " --exit-code\t\texit code used with --exit-after-ms" << std::endl;
    std::cout << " --silent\t\taccept pings but never reply" << std::endl;
    std::cout << " --once-marker\t\tapply --exit-after-ms only if marker file is missing" << std::endl;
    std::cout << " --ignore-term\t\tignore SIGTERM" << std::endl;
    std::cout << " --startup-delay-ms\tdelay before control socket is opened" << std::endl;
    std::cout << " --usr1-file\t\tappend a line to file on SIGUSR1" << std::endl;
}

int main(int argc, char **argv) {
    std::string socket;
    const char *env_socket = getenv("VIGIL_SOCKET");
    if (env_socket != nullptr) socket.assign(env_socket);
    long exit_after = -1;
    int exit_code = 0;
    bool silent = false;
    bool ignore_term = false;
    long startup_delay = 0;
    std::string once_marker;
    std::string usr1_file;

    int option_index = 0;
    struct option long_options[] = {{"socket", required_argument, 0, 0},
                                    {"exit-after-ms", required_argument, 0, 0},
                                    {"exit-code", required_argument, 0, 0},
                                    {"silent", no_argument, 0, 0},
                                    {"once-marker", required_argument, 0, 0},
                                    {"ignore-term", no_argument, 0, 0},
                                    {"startup-delay-ms", required_argument, 0, 0},
                                    {"usr1-file", required_argument, 0, 0},
                                    {0, 0, 0, 0}};
    int opt;
    while ((opt = getopt_long(argc, argv, "?", long_options, &option_index)) != -1) {
        if (opt != 0) {
            print_help();
            return 1;
        }
        switch (option_index) {
            case 0:
                socket.assign(optarg);
                break;
            case 1:
                exit_after = atol(optarg);
                break;
            case 2:
                exit_code = atoi(optarg);
                break;
            case 3:
                silent = true;
                break;
            case 4:
                once_marker.assign(optarg);
                break;
            case 5:
                ignore_term = true;
                break;
            case 6:
                startup_delay = atol(optarg);
                break;
            case 7:
                usr1_file.assign(optarg);
                break;
            default:
                break;
        }
    }

    // misbehave only on first run
    if (!once_marker.empty()) {
        if (boost::filesystem::exists(once_marker))
            exit_after = -1;
        else
            std::ofstream(once_marker) << getpid() << std::endl;
    }

    signal(SIGTERM, ignore_term ? SIG_IGN : &on_signal);
    signal(SIGINT, &on_signal);
    signal(SIGUSR1, &on_signal);
    signal(SIGPIPE, SIG_IGN);

    if (startup_delay > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(startup_delay));

    vigil::PingResponder resp(socket);
    if (!socket.empty() && resp.start()) return 1;
    resp.set_replying(!silent);

    auto started = std::chrono::steady_clock::now();
    while (!terminated) {
        if (exit_after >= 0 &&
            std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(exit_after)) {
            resp.stop();
            return exit_code;
        }
        if (usr1_received) {
            usr1_received = 0;
            if (!usr1_file.empty()) std::ofstream(usr1_file, std::ios::app) << "usr1" << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    resp.stop();
    return 0;
}
