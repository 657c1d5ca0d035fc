/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_PING_H_
#define VIGIL_PING_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

namespace vigil {
    /**
     * Ping outcome
     */
    enum PingResult {
        /** matching acknowledgement received */
        PR_ALIVE            = 0,
        /** no (complete) reply within timeout */
        PR_TIMEOUT          = 1,
        /** control channel broken or reply malformed */
        PR_CHANNEL_ERROR    = 2
    };

    /**
     * Get ping result name
     * @param[in]   res     Ping result
     * @return      Result name C string
     */
    const char *ping_result_str(PingResult res);

    /**
     * Liveness probe over daemon's control channel
     */
    class PingChannel {
    public:
        PingChannel() = default;
        PingChannel(const PingChannel &o) = delete;
        PingChannel &operator=(const PingChannel &o) = delete;
        virtual ~PingChannel() = default;

        /**
         * Send ping request and wait for acknowledgement
         * @param[in]   endpoint    Control channel endpoint
         * @param[in]   timeout     Reply timeout
         * @return      Ping result
         */
        virtual PingResult ping(const std::string &endpoint,
                                std::chrono::milliseconds timeout) = 0;
    };

    /**
     * JSON-RPC ping over UNIX domain stream socket
     */
    class LocalPingChannel : public PingChannel {
    public:
        LocalPingChannel() = default;

        PingResult ping(const std::string &endpoint,
                        std::chrono::milliseconds timeout) override;

    private:
        /** request id generator */
        std::atomic<int> next_id{1};
    };

    /**
     * Daemon side of the control channel; answers ping requests
     */
    class PingResponder {
    public:
        explicit PingResponder(const std::string &_path);
        PingResponder(const PingResponder &o) = delete;
        PingResponder &operator=(const PingResponder &o) = delete;
        ~PingResponder();

        /**
         * Bind socket and start serving in background thread
         * @return  0 for success, 1 if error occurred
         */
        int start();

        /**
         * Stop serving, close and unlink socket
         */
        void stop();

        /**
         * Enable/disable replies; connections are still accepted
         * and requests read when disabled
         * @param[in]   _replying   Reply flag
         */
        void set_replying(bool _replying);

        /**
         * Get number of answered requests
         * @return  Number of answered requests
         */
        uint64_t get_answered() const;

        /**
         * Process one request line (JSON-RPC)
         * @param[in]   line        Request line
         * @param[out]  reply       Reply line (without newline)
         * @return      true if reply should be sent
         */
        static bool process_request(const std::string &line, std::string &reply);

    private:
        class Session;
        void do_accept();

        /** socket path */
        std::string path;
        /** asio context */
        boost::asio::io_context ioc;
        /** listener */
        boost::asio::local::stream_protocol::acceptor acceptor;
        /** service thread */
        std::thread th;
        /** reply flag */
        std::atomic<bool> replying{true};
        /** answered counter */
        std::atomic<uint64_t> answered{0};
        /** running flag */
        bool running = false;
    };
}

#endif /* VIGIL_PING_H_ */
