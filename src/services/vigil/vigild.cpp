/*
 * SPDX-License-Identifier: MIT
 *
 */

#include "vigil.h"
#include <vigil_err_codes.h>
#include <vigil_utils.h>

// main
int main(int argc, char **argv) {
    // descriptors leaked by parent must not reach supervised daemons
    vigil_utils::close_inherited_fds();
    // create daemon
    VigildDescriptor dd(DAEMON_TYPE, DAEMON_ID, DAEMON_DESCRIPTION);
    // process arguments
    dd.process_args(argc, argv);
    // config
    if (dd.init_config()) return vigil::error::EXIT_CONFIG_ERROR;
    // init/start daemon
    if (dd.detach)
        vigil::daemon_init(&dd);
    else
        vigil::daemon_start(&dd);
    if (dd.init_pid_file()) return vigil::error::EXIT_CONFIG_ERROR;
    // init
    dd.init();
    // signals
    signal(SIGTERM, &vigil::signal_handler);
    signal(SIGINT, &vigil::signal_handler);
    signal(SIGUSR1, &vigil::signal_handler);
    signal(SIGPIPE, SIG_IGN);
    // supervise until terminated
    int res = dd.run();
    // cleanup
    vigil::daemon_terminate(&dd);
    return res;
}
