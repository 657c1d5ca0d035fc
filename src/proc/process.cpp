/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <process.h>
#include <daemon.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include <thread>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <boost/process/handles.hpp>

namespace bp = boost::process;
namespace bfs = boost::filesystem;

// exit polling step during termination
static constexpr std::chrono::milliseconds TERM_POLL_STEP(20);
// reap limit after SIGKILL (uninterruptible sleep)
static constexpr std::chrono::milliseconds KILL_TIMEOUT(2000);

vigil::ProcessHandle::ProcessHandle(bp::child &&_child,
                                    const std::string &_executable)
    : child(std::move(_child)),
      executable(_executable),
      start_time(std::chrono::system_clock::now()) {

}

vigil::ProcessHandle::~ProcessHandle() {
    // never leave an orphan behind
    if (!wait_nonblocking().exited) force_kill();
}

std::unique_ptr<vigil::ProcessHandle>
vigil::ProcessHandle::spawn(const std::string &executable,
                            const std::vector<std::string> &args,
                            const EnvMap &env) {
    // check executable
    boost::system::error_code bec;
    if (!bfs::exists(executable, bec))
        throw SpawnError("executable not found: " + executable);
    if (bfs::is_directory(executable, bec))
        throw SpawnError("executable is a directory: " + executable);
    if (access(executable.c_str(), X_OK) != 0)
        throw SpawnError("executable not permitted: " + executable);

    // child environment (parent env + extra)
    bp::environment cenv = boost::this_process::environment();
    for (auto it = env.cbegin(); it != env.cend(); ++it)
        cenv[it->first] = it->second;

    try {
        // only stdio is inherited, control sockets opened by
        // other supervisor threads stay in the watchdog; limit_handles
        // also closes the exec error pipe, so a failing exec (e.g. bad
        // interpreter) shows up as exit code 1 instead of an exception
        bp::child c(bp::exe = executable,
                    bp::args = args,
                    cenv,
                    bp::std_in < bp::null,
                    bp::std_out > stdout,
                    bp::std_err > stderr,
                    bp::limit_handles);
        return std::unique_ptr<ProcessHandle>(new ProcessHandle(std::move(c),
                                                                executable));

    } catch (std::system_error &e) {
        throw SpawnError(std::string("cannot launch ") + executable + ": " +
                         e.what());
    }
}

void vigil::ProcessHandle::update_exit_status() {
    int st = child.native_exit_code();
    exit_status.exited = true;
    if (WIFSIGNALED(st)) {
        exit_status.signal = WTERMSIG(st);
        exit_status.code = 128 + exit_status.signal;
    } else if (WIFEXITED(st)) {
        exit_status.code = WEXITSTATUS(st);
    }
}

int vigil::ProcessHandle::signal(SignalKind kind) {
    if (exit_status.exited) return 1;
    int signum;
    switch (kind) {
        case SK_GRACEFUL:
            signum = SIGTERM;
            break;
        case SK_FORCEFUL:
            signum = SIGKILL;
            break;
        case SK_LOG_ROTATE:
            signum = SIGUSR1;
            break;
        default:
            return 1;
    }
    return (::kill(child.id(), signum) == 0) ? 0 : 1;
}

vigil::ExitStatus vigil::ProcessHandle::wait_nonblocking() {
    if (exit_status.exited) return exit_status;

    std::error_code ec;
    bool r = child.running(ec);
    if (ec) {
        // child is not ours anymore (ECHILD handled by boost), report
        // as exited to avoid supervising a ghost
        vigil::log(LLT_ERROR,
                   "waitpid failed for pid [%d]: %s",
                   child.id(),
                   ec.message().c_str());
        exit_status.exited = true;
        exit_status.code = -1;
        return exit_status;
    }
    if (!r) update_exit_status();
    return exit_status;
}

vigil::ExitStatus vigil::ProcessHandle::terminate(std::chrono::milliseconds grace) {
    if (wait_nonblocking().exited) return exit_status;

    // cooperative stop
    signal(SK_GRACEFUL);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (wait_nonblocking().exited) return exit_status;
        std::this_thread::sleep_for(TERM_POLL_STEP);
    }

    // escalate
    vigil::log(LLT_WARNING,
               "[%s] pid [%d] did not exit within %ld ms, sending SIGKILL",
               executable.c_str(),
               child.id(),
               (long)grace.count());
    return force_kill();
}

vigil::ExitStatus vigil::ProcessHandle::force_kill() {
    signal(SK_FORCEFUL);
    auto deadline = std::chrono::steady_clock::now() + KILL_TIMEOUT;
    while (std::chrono::steady_clock::now() < deadline) {
        if (wait_nonblocking().exited) return exit_status;
        std::this_thread::sleep_for(TERM_POLL_STEP);
    }

    // stuck in kernel, give up on reaping
    vigil::log(LLT_ERROR,
               "[%s] pid [%d] not reaped %ld ms after SIGKILL, detaching",
               executable.c_str(),
               child.id(),
               (long)KILL_TIMEOUT.count());
    child.detach();
    exit_status.exited = true;
    exit_status.signal = SIGKILL;
    exit_status.code = 128 + SIGKILL;
    return exit_status;
}

pid_t vigil::ProcessHandle::get_pid() const {
    return child.id();
}

std::chrono::system_clock::time_point vigil::ProcessHandle::get_start_time() const {
    return start_time;
}

const std::string &vigil::ProcessHandle::get_executable() const {
    return executable;
}
