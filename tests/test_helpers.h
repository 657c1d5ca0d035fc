/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_TEST_HELPERS_H_
#define VIGIL_TEST_HELPERS_H_

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/filesystem.hpp>
#include <supervisor.h>
#include <vigil_config.h>

#ifndef VIGIL_TEST_DAEMON_PATH
#error "VIGIL_TEST_DAEMON_PATH not defined"
#endif

namespace vigil_test {
    // helper daemon speaking the ping protocol
    constexpr const char *TEST_DAEMON = VIGIL_TEST_DAEMON_PATH;

    /**
     * Temporary directory, removed with its contents on destruction
     */
    class TempDir {
    public:
        TempDir() {
            path = boost::filesystem::temp_directory_path() /
                   boost::filesystem::unique_path("vigil-%%%%-%%%%");
            boost::filesystem::create_directories(path);
        }
        TempDir(const TempDir &o) = delete;
        TempDir &operator=(const TempDir &o) = delete;
        ~TempDir() {
            boost::system::error_code ec;
            boost::filesystem::remove_all(path, ec);
        }

        std::string str() const { return path.string(); }
        std::string file(const std::string &name) const { return (path / name).string(); }

    private:
        boost::filesystem::path path;
    };

    /**
     * Poll predicate until true or timeout
     */
    inline bool wait_until(const std::function<bool()> &pred,
                           std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    /**
     * Short timings so supervision cycles complete within a test
     */
    inline void fast_timing(vigil::WatchdogConfig &cfg) {
        cfg.supervisor.poll_interval = std::chrono::milliseconds(100);
        cfg.supervisor.startup_poll_interval = std::chrono::milliseconds(50);
        cfg.supervisor.ping_timeout = std::chrono::milliseconds(200);
        cfg.supervisor.ping_failure_threshold = 2;
        cfg.supervisor.startup_timeout = std::chrono::milliseconds(3000);
        cfg.supervisor.grace_period = std::chrono::milliseconds(500);
        cfg.supervisor.stability_window = std::chrono::milliseconds(500);

        cfg.restart.initial_delay = std::chrono::milliseconds(100);
        cfg.restart.max_delay = std::chrono::milliseconds(400);
        cfg.restart.multiplier = 2.0;
        cfg.restart.jitter = 0.2;
        cfg.restart.max_retries = 3;
        cfg.restart.window = std::chrono::milliseconds(10000);
    }

    /**
     * Configuration with all daemons running the helper daemon
     */
    inline vigil::WatchdogConfig test_config(const TempDir &dir) {
        json j = json::object();
        j["data_path"] = dir.str();
        j["sockets_path"] = dir.file("sockets");
        j["check_running"] = false;
        j["daemons"] = json::object();
        for (auto &k : vigil::daemon_kinds()) {
            j["daemons"][k.name]["executable"] = TEST_DAEMON;
        }
        vigil::WatchdogConfig cfg = vigil::WatchdogConfig::from_json(j);
        fast_timing(cfg);
        return cfg;
    }

    /**
     * Supervisor event recorder
     */
    class EventRecorder : public vigil::SupervisorCallback {
    public:
        struct Entry {
            vigil::SupervisorEventType type;
            vigil::DaemonKind kind;
            std::string name;
            pid_t pid;
            vigil::steady_clock::time_point ts;
        };

        void run(const vigil::SupervisorEvent &ev) override {
            std::lock_guard<std::mutex> l(mtx);
            events.push_back({ev.type, ev.kind, *ev.name, ev.pid, ev.ts});
        }

        std::vector<Entry> get() const {
            std::lock_guard<std::mutex> l(mtx);
            return events;
        }

        std::size_t count(vigil::SupervisorEventType type, vigil::DaemonKind kind) const {
            std::lock_guard<std::mutex> l(mtx);
            std::size_t c = 0;
            for (auto &e : events) {
                if (e.type == type && e.kind == kind) ++c;
            }
            return c;
        }

        // first event of type for daemon
        bool first(vigil::SupervisorEventType type,
                   vigil::DaemonKind kind,
                   Entry &out) const {
            std::lock_guard<std::mutex> l(mtx);
            for (auto &e : events) {
                if (e.type == type && e.kind == kind) {
                    out = e;
                    return true;
                }
            }
            return false;
        }

    private:
        mutable std::mutex mtx;
        std::vector<Entry> events;
    };
}

#endif /* VIGIL_TEST_HELPERS_H_ */
