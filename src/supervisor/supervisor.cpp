/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <supervisor.h>
#include <daemon.h>

const char *vigil::supervisor_state_str(SupervisorState state) {
    switch (state) {
        case SS_STOPPED:
            return "stopped";
        case SS_STARTING:
            return "starting";
        case SS_RUNNING:
            return "running";
        case SS_RESTARTING:
            return "restarting";
        case SS_FAILED_PERMANENTLY:
            return "failed";
        case SS_STOPPING:
            return "stopping";
        default:
            return "unknown";
    }
}

vigil::DaemonSupervisor::DaemonSupervisor(const DaemonSpec &_spec,
                                          const SupervisorConfig &_cfg,
                                          const RestartConfig &_rcfg,
                                          std::shared_ptr<PingChannel> _pinger)
    : spec(_spec),
      cfg(_cfg),
      policy(_rcfg),
      pinger(std::move(_pinger)) {

    if (!pinger) pinger = std::make_shared<LocalPingChannel>();
}

vigil::DaemonSupervisor::~DaemonSupervisor() {
    stop();
}

void vigil::DaemonSupervisor::set_callback(SupervisorCallback *_cb) {
    cb = _cb;
}

const vigil::DaemonSpec &vigil::DaemonSupervisor::get_spec() const {
    return spec;
}

vigil::SupervisorState vigil::DaemonSupervisor::status() const {
    std::lock_guard<std::mutex> l(mtx);
    return state;
}

vigil::SupervisorStats vigil::DaemonSupervisor::stats() const {
    std::lock_guard<std::mutex> l(mtx);
    SupervisorStats res = st;
    res.state = state;
    return res;
}

void vigil::DaemonSupervisor::emit(SupervisorEventType type, pid_t pid) {
    if (cb == nullptr) return;
    SupervisorEvent ev{type, spec.kind, &spec.name, pid, steady_clock::now()};
    cb->run(ev);
}

int vigil::DaemonSupervisor::start() {
    std::lock_guard<std::mutex> cl(ctrl_mtx);
    {
        std::lock_guard<std::mutex> l(mtx);
        if (state == SS_STARTING ||
            state == SS_RUNNING ||
            state == SS_RESTARTING) return 0;
    }

    // previous loop has finished (permanent failure)
    if (th.joinable()) th.join();

    {
        std::lock_guard<std::mutex> l(mtx);
        if (state == SS_FAILED_PERMANENTLY) {
            vigil::log(LLT_INFO,
                       "[%s] restart requested after permanent failure",
                       spec.name.c_str());
        }
        policy.reset(counter);
        st.failures = 0;
        st.ping_failures = 0;
        stop_requested = false;
        state = SS_STARTING;
    }

    // monitor loop
    th = std::thread(&DaemonSupervisor::monitor_loop, this);
    return 0;
}

int vigil::DaemonSupervisor::stop() {
    std::lock_guard<std::mutex> cl(ctrl_mtx);
    {
        std::lock_guard<std::mutex> l(mtx);
        // nothing to do
        if (state == SS_STOPPED && !th.joinable()) return 0;

        stop_requested = true;
        if (state != SS_FAILED_PERMANENTLY) state = SS_STOPPING;
    }
    cv.notify_all();
    if (th.joinable()) th.join();

    // child might still be alive if loop was not running
    terminate_child();

    {
        std::lock_guard<std::mutex> l(mtx);
        state = SS_STOPPED;
        st.pid = 0;
    }
    vigil::log(LLT_INFO, "[%s] stopped", spec.name.c_str());
    emit(SET_STOPPED, 0);
    return 0;
}

int vigil::DaemonSupervisor::forward_signal(SignalKind kind) {
    std::lock_guard<std::mutex> l(handle_mtx);
    if (!handle) return 1;
    return handle->signal(kind);
}

vigil::DaemonSupervisor::WaitResult
vigil::DaemonSupervisor::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> l(mtx);
    if (cv.wait_for(l, d, [this] { return stop_requested; })) return WR_STOP;
    return WR_TIMEOUT;
}

bool vigil::DaemonSupervisor::spawn_child() {
    std::unique_ptr<ProcessHandle> h;
    try {
        h = ProcessHandle::spawn(spec.executable, spec.args, spec.env);

    } catch (SpawnError &e) {
        vigil::log(LLT_ERROR, "[%s] %s", spec.name.c_str(), e.what());
        return false;
    }

    pid_t pid = h->get_pid();
    auto started = h->get_start_time();
    vigil::log(LLT_INFO,
               "[%s] started [%s], pid [%d]",
               spec.name.c_str(),
               h->get_executable().c_str(),
               pid);
    {
        std::lock_guard<std::mutex> l(handle_mtx);
        handle = std::move(h);
    }
    {
        std::lock_guard<std::mutex> l(mtx);
        st.pid = pid;
        st.started = started;
        ++st.spawns;
        st.ping_failures = 0;
        state = SS_STARTING;
    }
    spawn_ts = steady_clock::now();
    healthy = false;
    emit(SET_SPAWNED, pid);
    return true;
}

void vigil::DaemonSupervisor::terminate_child() {
    std::unique_ptr<ProcessHandle> h;
    {
        std::lock_guard<std::mutex> l(handle_mtx);
        h = std::move(handle);
    }
    if (!h) return;

    pid_t pid = h->get_pid();
    ExitStatus es = h->terminate(cfg.grace_period);
    {
        std::lock_guard<std::mutex> l(mtx);
        st.last_exit = es;
        st.pid = 0;
    }
    vigil::log(LLT_INFO,
               "[%s] pid [%d] terminated, code [%d], signal [%d]",
               spec.name.c_str(),
               pid,
               es.code,
               es.signal);
}

bool vigil::DaemonSupervisor::handle_failure(const char *reason) {
    std::chrono::milliseconds delay(0);
    bool give_up;
    unsigned int failures;
    {
        std::lock_guard<std::mutex> l(mtx);
        // stop in flight, shut down silently
        if (stop_requested) return false;

        policy.record_failure(counter, steady_clock::now());
        st.failures = counter.failures;
        failures = counter.failures;
        give_up = policy.should_give_up(counter);
        if (give_up)
            state = SS_FAILED_PERMANENTLY;
        else {
            delay = policy.next_delay(counter);
            state = SS_RESTARTING;
        }
    }

    // restart ceiling exceeded
    if (give_up) {
        vigil::log(LLT_ERROR,
                   "[%s] %s, failed %u times within %ld ms, giving up",
                   spec.name.c_str(),
                   reason,
                   failures,
                   (long)policy.get_config().window.count());
        emit(SET_FAILED, 0);
        return false;
    }

    vigil::log(LLT_WARNING,
               "[%s] %s, restarting in %ld ms (failure %u)",
               spec.name.c_str(),
               reason,
               (long)delay.count(),
               failures);
    emit(SET_RESTARTING, 0);

    // backoff
    if (wait_for(delay) == WR_STOP) return false;

    std::lock_guard<std::mutex> l(mtx);
    counter.last_restart = steady_clock::now();
    ++st.restarts;
    return true;
}

bool vigil::DaemonSupervisor::check_child() {
    ExitStatus es;
    pid_t pid = 0;
    {
        std::lock_guard<std::mutex> l(handle_mtx);
        es = handle->wait_nonblocking();
        pid = handle->get_pid();
        if (es.exited) handle.reset();
    }

    // process exit
    if (es.exited) {
        {
            std::lock_guard<std::mutex> l(mtx);
            st.last_exit = es;
            st.pid = 0;
            if (stop_requested) return false;
        }
        if (es.signal != 0)
            vigil::log(LLT_WARNING,
                       "[%s] pid [%d] killed by signal [%d]",
                       spec.name.c_str(),
                       pid,
                       es.signal);
        else
            vigil::log(LLT_WARNING,
                       "[%s] pid [%d] exited with code [%d]",
                       spec.name.c_str(),
                       pid,
                       es.code);
        emit(SET_EXITED, pid);
        return handle_failure("process exited");
    }

    // liveness probe
    PingResult pr = pinger->ping(spec.socket_path, cfg.ping_timeout);
    auto now = steady_clock::now();

    if (pr == PR_ALIVE) {
        bool became_running = false;
        bool stable = false;
        if (!healthy) {
            healthy = true;
            healthy_since = now;
        }
        {
            std::lock_guard<std::mutex> l(mtx);
            st.ping_failures = 0;
            if (state == SS_STARTING) {
                state = SS_RUNNING;
                became_running = true;
            }
            // stability window
            if (counter.failures > 0 &&
                (now - healthy_since) >= cfg.stability_window) {
                policy.reset(counter);
                st.failures = 0;
                stable = true;
            }
        }
        if (became_running) {
            vigil::log(LLT_INFO, "[%s] running, pid [%d]", spec.name.c_str(), pid);
            emit(SET_RUNNING, pid);
        }
        if (stable) {
            vigil::log(LLT_INFO,
                       "[%s] stable for %ld ms, restart counter reset",
                       spec.name.c_str(),
                       (long)cfg.stability_window.count());
        }
        return true;
    }

    // ping failed
    healthy = false;
    unsigned int pf;
    SupervisorState s;
    {
        std::lock_guard<std::mutex> l(mtx);
        pf = ++st.ping_failures;
        s = state;
    }
    vigil::log(LLT_DEBUG,
               "[%s] ping %s (%u/%u)",
               spec.name.c_str(),
               ping_result_str(pr),
               pf,
               cfg.ping_failure_threshold);

    if (s == SS_STARTING) {
        // still within startup grace
        if ((now - spawn_ts) < cfg.startup_timeout) return true;
        vigil::log(LLT_ERROR,
                   "[%s] no ping reply within %ld ms of startup",
                   spec.name.c_str(),
                   (long)cfg.startup_timeout.count());

    } else {
        if (pf < cfg.ping_failure_threshold) return true;
        vigil::log(LLT_WARNING,
                   "[%s] unresponsive, %u consecutive ping failures",
                   spec.name.c_str(),
                   pf);
    }

    emit(SET_UNRESPONSIVE, pid);
    terminate_child();
    return handle_failure("daemon unresponsive");
}

void vigil::DaemonSupervisor::monitor_loop() {
    while (true) {
        bool has_handle;
        {
            std::lock_guard<std::mutex> l(mtx);
            if (stop_requested) break;
        }
        {
            std::lock_guard<std::mutex> l(handle_mtx);
            has_handle = (handle != nullptr);
        }

        // (re)spawn, spawn error is handled like a crash
        if (!has_handle && !spawn_child()) {
            if (!handle_failure("spawn error")) break;
            continue;
        }

        // poll interval
        auto interval = (status() == SS_STARTING) ?
                        cfg.startup_poll_interval :
                        cfg.poll_interval;
        if (wait_for(interval) == WR_STOP) break;

        if (!check_child()) break;
    }

    // stop requested or permanent failure
    {
        std::lock_guard<std::mutex> l(mtx);
        if (state != SS_FAILED_PERMANENTLY) state = SS_STOPPING;
    }
    terminate_child();
}
