/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_DAEMON_H_
#define VIGIL_DAEMON_H_

#include <iostream>
#include <syslog.h>
#include <signal.h>
#include <stdarg.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <atomic>
#include <string>

namespace vigil {
    /**
     * Log level type
     */
    enum LogLevelType {
        LLT_ERROR       = 3,
        LLT_WARNING     = 4,
        LLT_INFO        = 6,
        LLT_DEBUG       = 7
    };

    /**
     * Daemon descriptor class
     */
    class DaemonDescriptor {
    public:
        /**
         * Custom constructor
         * @param[in]   _type   Daemon type C string
         * @param[in]   _id     Daemon id C string
         * @param[in]   _desc   Daemon description C string
         */
        DaemonDescriptor(const char *_type, const char *_id, const char *_desc);
        DaemonDescriptor(const DaemonDescriptor &o) = delete;
        DaemonDescriptor &operator=(const DaemonDescriptor &o) = delete;

        /**
         * Default destructor
         */
        virtual ~DaemonDescriptor();

        /**
         * Get daemon type
         * @return  Daemon type C string
         */
        const char *get_daemon_type() const;

        /**
         * Set daemon type
         * @param[in]   _type   Daemon type C string
         * @return      0 for success or error code
         */
        int set_daemon_type(const char *_type);

        /**
         * Get daemon description
         * @return  Daemon description C string
         */
        const char *get_daemon_description() const;

        /**
         * Set daemon description
         * @param[in]   _desc   Daemon description C string
         */
        int set_daemon_description(const char *_desc);

        /**
         * Get daemon id
         * @return  Daemon id C string
         */
        const char *get_daemon_id() const;

        /**
         * Get full daemon id (syslog ident)
         * @return  Full daemon id C string
         */
        const char *get_full_daemon_id() const;

        /**
         * Set daemon id
         * @param[in]   _id     Daemon id C string
         * @return      0 for success or error code
         */
        int set_daemon_id(const char *_id);

        /**
         * Process command line arguments
         * @param[in]   argc    Argument count
         * @param[in]   argv    Pointer to list of arguments
         *
         */
        virtual void process_args(int argc, char **argv) = 0;

        /**
         * Print help to standard output
         */
        virtual void print_help() = 0;

        /**
         * Signal handler method
         * @param[in]   signum  Signal code
         */
        virtual void signal_handler(int signum) = 0;

        /**
         * Log event
         * @param[in]   _log_level  Log level
         * @param[in]   msg         Log message C string
         * @param[in]   ...         Extra variable arguments
         */
        void log(LogLevelType _log_level, const char *msg, ...);

        /**
         * Log event (va_list variant)
         * @param[in]   _log_level  Log level
         * @param[in]   msg         Log message C string
         * @param[in]   argp        Variable arguments
         */
        void vlog(LogLevelType _log_level, const char *msg, va_list argp);

        /**
         *  Set log level
         *  @param[in]  _log_level  Log level
         */
        void set_log_level(LogLevelType _log_level);

        /**
         * Get log level
         * @return      Current log level
         */
        LogLevelType get_log_level() const;

        /**
         * Copy log messages to stderr
         * @param[in]   _stderr     Enable flag
         */
        void set_log_stderr(bool _stderr);

        /**
         * Terminate event handler
         */
        virtual void terminate() = 0;

    protected:
        /** daemon type */
        std::string daemon_type;
        /** daemon id */
        std::string daemon_id;
        /** full daemon id */
        std::string full_daemon_id;
        /** daemon description */
        std::string daemon_description;
        /** log level */
        std::atomic<LogLevelType> log_level;
        /** syslog options */
        std::atomic<int> log_options;
    };

    /**
     * Pointer to current daemon
     */
    extern DaemonDescriptor *CURRENT_DAEMON;

    /**
     * Signal handler method
     * @param[in]   signum  Signal number
     */
    void signal_handler(int signum);

    /**
     * Log via current daemon or directly to syslog if
     * daemon descriptor was not created
     * @param[in]   _log_level  Log level
     * @param[in]   msg         Log message C string
     * @param[in]   ...         Extra variable arguments
     */
    void log(LogLevelType _log_level, const char *msg, ...);

    /**
     * Detach from controlling terminal
     * @param[in]   daemon_descriptor   Pointer to daemon descriptor
     */
    void daemon_init(const DaemonDescriptor *daemon_descriptor);

    /**
     * Start daemon
     * @param[in]   daemon_descriptor   Pointer to daemon descriptor
     */
    void daemon_start(const DaemonDescriptor *daemon_descriptor);

    /**
     * Terminate daemon
     * @param[in]   daemon_descriptor   Pointer to daemon descriptor
     */
    void daemon_terminate(DaemonDescriptor *daemon_descriptor);
}


#endif /* VIGIL_DAEMON_H_ */
