/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_PROCESS_H_
#define VIGIL_PROCESS_H_

#include <sys/types.h>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/process/child.hpp>

namespace vigil {
    /**
     * Child process could not be launched
     */
    class SpawnError : public std::runtime_error {
    public:
        explicit SpawnError(const std::string &msg) : std::runtime_error(msg) {}
    };

    /**
     * Signal request type
     */
    enum SignalKind {
        /** cooperative stop (SIGTERM) */
        SK_GRACEFUL     = 0,
        /** forceful kill (SIGKILL) */
        SK_FORCEFUL     = 1,
        /** log rotation request (SIGUSR1) */
        SK_LOG_ROTATE   = 2
    };

    /**
     * Child exit status
     */
    struct ExitStatus {
        /** process has exited and was reaped */
        bool exited = false;
        /** exit code (valid if not signaled) */
        int code = 0;
        /** terminating signal or 0 */
        int signal = 0;

        bool clean() const { return exited && signal == 0 && code == 0; }
    };

    using EnvMap = std::map<std::string, std::string>;

    /**
     * Handle of one supervised child process
     */
    class ProcessHandle {
    public:
        ProcessHandle(const ProcessHandle &o) = delete;
        ProcessHandle &operator=(const ProcessHandle &o) = delete;
        ~ProcessHandle();

        /**
         * Launch child process; parent environment is extended with env
         * @param[in]   executable  Path to executable
         * @param[in]   args        Argument list (without argv[0])
         * @param[in]   env         Extra environment variables
         * @return      Process handle
         * @throw       SpawnError  Executable cannot be launched
         */
        static std::unique_ptr<ProcessHandle> spawn(const std::string &executable,
                                                    const std::vector<std::string> &args,
                                                    const EnvMap &env);

        /**
         * Send signal to child
         * @param[in]   kind    Signal kind
         * @return      0 for success, 1 if error occurred or child has exited
         */
        int signal(SignalKind kind);

        /**
         * Reap child if it has exited
         * @return  Exit status, exited == false if still running
         */
        ExitStatus wait_nonblocking();

        /**
         * Graceful-then-forceful termination; SIGTERM first and SIGKILL
         * if child is still alive after grace period. Child is reaped
         * on return unless it survives SIGKILL for two seconds, in which
         * case it is detached.
         * @param[in]   grace   Grace period
         * @return      Exit status
         */
        ExitStatus terminate(std::chrono::milliseconds grace);

        pid_t get_pid() const;
        std::chrono::system_clock::time_point get_start_time() const;
        const std::string &get_executable() const;

    private:
        ProcessHandle(boost::process::child &&_child, const std::string &_executable);
        void update_exit_status();
        ExitStatus force_kill();

        /** boost process child */
        boost::process::child child;
        /** executable path */
        std::string executable;
        /** start timestamp */
        std::chrono::system_clock::time_point start_time;
        /** exit status */
        ExitStatus exit_status;
    };
}

#endif /* VIGIL_PROCESS_H_ */
