/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <watchdog.h>
#include <daemon.h>
#include <vigil_err_codes.h>
#include <algorithm>
#include <thread>
#include <boost/filesystem.hpp>

namespace bfs = boost::filesystem;
using namespace vigil::error;

// run loop tick
static const std::chrono::milliseconds TICK(100);

vigil::Watchdog::Watchdog(const WatchdogConfig &_cfg,
                          std::shared_ptr<PingChannel> _pinger)
    : cfg(_cfg),
      pinger(std::move(_pinger)) {

    if (!pinger) pinger = std::make_shared<LocalPingChannel>();

    // startup level of each daemon (daemons are in dependency order)
    std::vector<std::size_t> lvl(cfg.daemons.size(), 0);
    for (std::size_t i = 0; i < cfg.daemons.size(); i++) {
        const DaemonSpec &d = cfg.daemons[i];
        for (auto dep : d.depends_on) {
            for (std::size_t j = 0; j < i; j++) {
                if (cfg.daemons[j].kind == dep)
                    lvl[i] = std::max(lvl[i], lvl[j] + 1);
            }
        }
        if (lvl[i] >= levels.size()) levels.resize(lvl[i] + 1);
        levels[lvl[i]].push_back(i);

        sups.emplace_back(new DaemonSupervisor(d,
                                               cfg.supervisor,
                                               cfg.restart,
                                               pinger));
    }
}

vigil::Watchdog::~Watchdog() {
    stop_all();
}

void vigil::Watchdog::request_shutdown() {
    shutdown_requested.store(true);
}

void vigil::Watchdog::request_log_rotation() {
    log_rotation_requested.store(true);
}

void vigil::Watchdog::set_callback(SupervisorCallback *cb) {
    for (auto &s : sups) s->set_callback(cb);
}

const std::vector<std::vector<std::size_t>> &vigil::Watchdog::get_levels() const {
    return levels;
}

vigil::SupervisorState vigil::Watchdog::status(DaemonKind kind) const {
    for (auto &s : sups) {
        if (s->get_spec().kind == kind) return s->status();
    }
    return SS_STOPPED;
}

vigil::SupervisorStats vigil::Watchdog::stats(DaemonKind kind) const {
    for (auto &s : sups) {
        if (s->get_spec().kind == kind) return s->stats();
    }
    return SupervisorStats();
}

json vigil::Watchdog::health() const {
    auto now = std::chrono::system_clock::now();
    json j = json::object();
    j["daemons"] = json::object();
    for (auto &s : sups) {
        SupervisorStats st = s->stats();
        json d = json::object();
        d["state"] = supervisor_state_str(st.state);
        d["pid"] = st.pid;
        d["spawns"] = st.spawns;
        d["restarts"] = st.restarts;
        d["failures"] = st.failures;
        d["ping_failures"] = st.ping_failures;
        int64_t uptime = 0;
        if (st.pid != 0) {
            uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
                         now - st.started).count();
            if (uptime < 0) uptime = 0;
        }
        d["uptime_ms"] = uptime;
        j["daemons"][s->get_spec().name] = d;
    }
    j["failed"] = any_failed();
    return j;
}

bool vigil::Watchdog::any_failed() const {
    return std::any_of(sups.cbegin(),
                       sups.cend(),
                       [](const std::unique_ptr<DaemonSupervisor> &s) {
                           return s->status() == SS_FAILED_PERMANENTLY;
                       });
}

int vigil::Watchdog::check_running() {
    for (auto &d : cfg.daemons) {
        if (pinger->ping(d.socket_path, cfg.supervisor.ping_timeout) == PR_ALIVE) {
            vigil::log(LLT_ERROR,
                       "[%s] already running, socket [%s] answers ping",
                       d.name.c_str(),
                       d.socket_path.c_str());
            return 1;
        }
    }
    return 0;
}

vigil::Watchdog::StartResult
vigil::Watchdog::wait_running(const std::vector<std::size_t> &level) {
    auto deadline = steady_clock::now() + cfg.supervisor.startup_timeout;
    while (true) {
        if (shutdown_requested.load()) return STR_SHUTDOWN;

        bool all = true;
        for (auto i : level) {
            SupervisorStats st = sups[i]->stats();
            // any failure of a dependency is fatal during startup
            if (st.failures > 0 || st.state == SS_FAILED_PERMANENTLY) {
                vigil::log(LLT_ERROR,
                           "[%s] failed during startup",
                           cfg.daemons[i].name.c_str());
                return STR_FAILED;
            }
            if (st.state != SS_RUNNING) all = false;
        }
        if (all) return STR_OK;

        if (steady_clock::now() >= deadline) {
            for (auto i : level) {
                if (sups[i]->status() != SS_RUNNING) {
                    vigil::log(LLT_ERROR,
                               "[%s] not running after %ld ms",
                               cfg.daemons[i].name.c_str(),
                               (long)cfg.supervisor.startup_timeout.count());
                }
            }
            return STR_FAILED;
        }
        std::this_thread::sleep_for(TICK);
    }
}

int vigil::Watchdog::stop_all() {
    bool failed = any_failed();

    // reverse dependency order
    for (auto lit = levels.rbegin(); lit != levels.rend(); ++lit) {
        for (auto i : *lit) sups[i]->stop();
    }
    return failed ? EXIT_DAEMON_FAILED : EXIT_OK;
}

int vigil::Watchdog::run() {
    // control sockets directory
    boost::system::error_code ec;
    bfs::create_directories(cfg.sockets_path, ec);
    if (ec) {
        vigil::log(LLT_WARNING,
                   "cannot create sockets directory [%s]: %s",
                   cfg.sockets_path.c_str(),
                   ec.message().c_str());
    }

    // pre-flight
    if (cfg.check_running && check_running()) return EXIT_ALREADY_RUNNING;

    // start levels in order
    for (std::size_t l = 0; l < levels.size(); l++) {
        for (auto i : levels[l]) sups[i]->start();

        // last level does not gate anything
        if (l + 1 == levels.size()) break;

        StartResult r = wait_running(levels[l]);
        if (r == STR_SHUTDOWN) {
            vigil::log(LLT_INFO, "shutdown requested during startup");
            stop_all();
            return EXIT_OK;
        }
        if (r == STR_FAILED) {
            vigil::log(LLT_ERROR, "startup failed, stopping all daemons");
            stop_all();
            return EXIT_BROKER_FAILED;
        }
    }
    vigil::log(LLT_INFO, "all daemons started");

    // supervise
    while (!shutdown_requested.load()) {
        if (log_rotation_requested.exchange(false)) {
            vigil::log(LLT_INFO, "forwarding log rotation request");
            for (auto &s : sups) s->forward_signal(SK_LOG_ROTATE);
        }
        if (cfg.shutdown_on_failure && any_failed()) {
            vigil::log(LLT_ERROR, "daemon failed permanently, shutting down");
            break;
        }
        std::this_thread::sleep_for(TICK);
    }

    vigil::log(LLT_INFO, "shutting down, health: %s", health().dump().c_str());
    int res = stop_all();
    vigil::log(LLT_INFO, "all daemons stopped, exit code [%d]", res);
    return res;
}
