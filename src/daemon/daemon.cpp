/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <daemon.h>
#include <string.h>
#include <stdlib.h>
#include <fcntl.h>

// static and extern
vigil::DaemonDescriptor *vigil::CURRENT_DAEMON = nullptr;

// DaemonDescriptor
vigil::DaemonDescriptor::DaemonDescriptor(const char *_type,
                                          const char *_id,
                                          const char *_desc)
    : log_level(LLT_INFO),
      log_options(LOG_PID | LOG_CONS) {

    CURRENT_DAEMON = this;

    if ((_id != nullptr) && (set_daemon_id(_id) > 0)) {
        std::cout
            << "ERROR: Maximum size of daemon id string is 15 characters!"
            << std::endl;
        exit(EXIT_FAILURE);
    }

    if ((_type != nullptr) && (set_daemon_type(_type) > 0)) {
        std::cout
            << "ERROR: Maximum size of daemon type string is 15 characters!"
            << std::endl;
        exit(EXIT_FAILURE);
    }

    if ((_desc != nullptr) && (set_daemon_description(_desc) > 0)) {
        std::cout << "ERROR: Maximum size of daemon description string is "
                     "500 characters!"
                  << std::endl;
        exit(EXIT_FAILURE);
    }
}

vigil::DaemonDescriptor::~DaemonDescriptor() {
    if (CURRENT_DAEMON == this) CURRENT_DAEMON = nullptr;
}

void vigil::DaemonDescriptor::set_log_level(LogLevelType _log_level) {
    log_level.store(_log_level);
}

vigil::LogLevelType vigil::DaemonDescriptor::get_log_level() const {
    return log_level.load();
}

void vigil::DaemonDescriptor::set_log_stderr(bool _stderr) {
    if (_stderr)
        log_options.fetch_or(LOG_PERROR);
    else
        log_options.fetch_and(~LOG_PERROR);
}

void vigil::DaemonDescriptor::vlog(LogLevelType _log_level,
                                   const char *msg,
                                   va_list argp) {
    // log level check
    if (_log_level > log_level.load()) return;
    // open log
    openlog(get_full_daemon_id(), log_options.load(), LOG_USER);
    // log
    vsyslog(LOG_USER | _log_level, msg, argp);
}

void vigil::DaemonDescriptor::log(LogLevelType _log_level, const char *msg, ...) {
    va_list argp;
    va_start(argp, msg);
    vlog(_log_level, msg, argp);
    va_end(argp);
}

int vigil::DaemonDescriptor::set_daemon_id(const char *_id) {
    if (_id == nullptr) return 1;
    if (strnlen(_id, 16) == 0) return 1;
    if (strnlen(_id, 16) < 16) {
        daemon_id.assign(_id);
        // prefix with "vigil."
        full_daemon_id.assign("vigil.");
        // add daemon id after prefix
        full_daemon_id.append(daemon_id);
        return 0;
    }

    return 1;
}

const char *vigil::DaemonDescriptor::get_daemon_id() const {
    return daemon_id.c_str();
}

const char *vigil::DaemonDescriptor::get_full_daemon_id() const {
    return full_daemon_id.c_str();
}

int vigil::DaemonDescriptor::set_daemon_type(const char *_type) {
    if (_type == nullptr) return 1;
    if (strnlen(_type, 16) == 0) return 1;
    if (strnlen(_type, 16) < 16) {
        daemon_type.assign(_type);
        return 0;
    }

    return 1;
}

int vigil::DaemonDescriptor::set_daemon_description(const char *_desc) {
    if (strnlen(_desc, 501) == 0) return 1;
    if (strnlen(_desc, 501) <= 500) {
        daemon_description.assign(_desc);
        return 0;
    }

    return 1;
}

const char *vigil::DaemonDescriptor::get_daemon_type() const {
    return daemon_type.c_str();
}

const char *vigil::DaemonDescriptor::get_daemon_description() const {
    return daemon_description.c_str();
}

void vigil::log(LogLevelType _log_level, const char *msg, ...) {
    va_list argp;
    va_start(argp, msg);
    if (CURRENT_DAEMON != nullptr)
        CURRENT_DAEMON->vlog(_log_level, msg, argp);
    else
        vsyslog(LOG_USER | _log_level, msg, argp);
    va_end(argp);
}

void vigil::daemon_start(const DaemonDescriptor *daemon_descriptor) {
    if (daemon_descriptor != nullptr) {
        // open log
        openlog(daemon_descriptor->get_full_daemon_id(), LOG_PID | LOG_CONS, LOG_USER);
        // log
        syslog(LOG_INFO, "starting...");
    }
}

void vigil::daemon_terminate(DaemonDescriptor *daemon_descriptor) {
    if (daemon_descriptor != nullptr) {
        syslog(LOG_INFO, "terminating...");
        daemon_descriptor->terminate();
        closelog();
    }
}

void vigil::signal_handler(int signum) {
    if (CURRENT_DAEMON != nullptr) CURRENT_DAEMON->signal_handler(signum);
}

void vigil::daemon_init(const DaemonDescriptor *daemon_descriptor) {
    pid_t pid, sid;

    /* Fork off the parent process */
    pid = fork();
    if (pid < 0) exit(EXIT_FAILURE);

    /* If we got a good PID, then we can exit the parent process. */
    if (pid > 0) exit(EXIT_SUCCESS);

    /* Change the file mode mask */
    umask(S_IWGRP | S_IWOTH);

    /* Create a new SID for the child process */
    sid = setsid();
    if (sid < 0) exit(EXIT_FAILURE);

    /* Change the current working directory.  This prevents the current
       directory from being locked; hence not being able to remove it. */
    if ((chdir("/")) < 0) exit(EXIT_FAILURE);

    /* Point standard file descriptors to /dev/null, children inherit them */
    int fd = open("/dev/null", O_RDWR);
    if (fd < 0) exit(EXIT_FAILURE);
    dup2(fd, STDIN_FILENO);
    dup2(fd, STDOUT_FILENO);
    dup2(fd, STDERR_FILENO);
    if (fd > STDERR_FILENO) close(fd);

    // start daemon
    daemon_start(daemon_descriptor);
}
