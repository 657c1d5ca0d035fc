/*
 * SPDX-License-Identifier: MIT
 *
 */

// Watchdog: dependency ordered startup, shutdown, exit codes

#include <gtest/gtest.h>
#include <future>
#include <thread>
#include <ping.h>
#include <vigil_err_codes.h>
#include <watchdog.h>
#include "test_helpers.h"

using namespace vigil;
using namespace vigil::error;
using std::chrono::milliseconds;
using vigil_test::EventRecorder;
using vigil_test::wait_until;

static DaemonSpec &spec_of(WatchdogConfig &cfg, DaemonKind kind) {
    for (auto &d : cfg.daemons) {
        if (d.kind == kind) return d;
    }
    throw std::invalid_argument("daemon not configured");
}

class WatchdogTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg = vigil_test::test_config(dir);
    }

    // run watchdog in background
    void launch() {
        wdog.reset(new Watchdog(cfg));
        wdog->set_callback(&events);
        result = std::async(std::launch::async, [this] { return wdog->run(); });
    }

    bool all_running() {
        return wdog->status(DK_BROKER) == SS_RUNNING &&
               wdog->status(DK_MONITOR) == SS_RUNNING &&
               wdog->status(DK_MANAGER) == SS_RUNNING;
    }

    int finish(milliseconds timeout = milliseconds(10000)) {
        if (result.wait_for(timeout) != std::future_status::ready) {
            ADD_FAILURE() << "watchdog did not return";
            wdog->request_shutdown();
        }
        return result.get();
    }

    vigil_test::TempDir dir;
    WatchdogConfig cfg;
    EventRecorder events;
    std::unique_ptr<Watchdog> wdog;
    std::future<int> result;
};

TEST_F(WatchdogTest, StartupLevels) {
    Watchdog w(cfg);
    auto &lv = w.get_levels();
    ASSERT_EQ(lv.size(), 2u);
    ASSERT_EQ(lv[0].size(), 1u);
    EXPECT_EQ(cfg.daemons[lv[0][0]].kind, DK_BROKER);
    EXPECT_EQ(lv[1].size(), 2u);
}

/**
 * Broker must be running before monitor and manager are spawned;
 * shutdown stops broker last
 */
TEST_F(WatchdogTest, OrderedStartupAndReverseShutdown) {
    launch();
    ASSERT_TRUE(wait_until([this] { return all_running(); }, milliseconds(10000)));

    json h = wdog->health();
    EXPECT_EQ(h["daemons"]["broker"]["state"], "running");
    EXPECT_EQ(h["daemons"]["manager"]["restarts"].get<int>(), 0);
    EXPECT_FALSE(h["failed"].get<bool>());
    int64_t up = h["daemons"]["broker"]["uptime_ms"].get<int64_t>();
    EXPECT_GE(up, 0);
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_GE(wdog->health()["daemons"]["broker"]["uptime_ms"].get<int64_t>(), up + 100);

    wdog->request_shutdown();
    EXPECT_EQ(finish(), EXIT_OK);

    EventRecorder::Entry broker_running, broker_stopped;
    ASSERT_TRUE(events.first(SET_RUNNING, DK_BROKER, broker_running));
    ASSERT_TRUE(events.first(SET_STOPPED, DK_BROKER, broker_stopped));
    for (auto k : {DK_MONITOR, DK_MANAGER}) {
        EventRecorder::Entry spawned, stopped;
        ASSERT_TRUE(events.first(SET_SPAWNED, k, spawned));
        ASSERT_TRUE(events.first(SET_STOPPED, k, stopped));
        EXPECT_LE(broker_running.ts, spawned.ts);
        EXPECT_LE(stopped.ts, broker_stopped.ts);
    }
    EXPECT_EQ(wdog->status(DK_BROKER), SS_STOPPED);
    EXPECT_EQ(wdog->status(DK_MONITOR), SS_STOPPED);
    EXPECT_EQ(wdog->status(DK_MANAGER), SS_STOPPED);
    EXPECT_FALSE(boost::filesystem::exists(spec_of(cfg, DK_BROKER).socket_path));
}

TEST_F(WatchdogTest, BrokerSpawnFailureIsFatal) {
    spec_of(cfg, DK_BROKER).executable = dir.file("vigil-broker-missing");
    auto t0 = std::chrono::steady_clock::now();
    launch();
    EXPECT_EQ(finish(), EXIT_BROKER_FAILED);
    EXPECT_LT(std::chrono::steady_clock::now() - t0,
              cfg.supervisor.startup_timeout + milliseconds(1000));

    EXPECT_EQ(events.count(SET_SPAWNED, DK_MONITOR), 0u);
    EXPECT_EQ(events.count(SET_SPAWNED, DK_MANAGER), 0u);
    EXPECT_EQ(wdog->stats(DK_MONITOR).spawns, 0u);
    EXPECT_EQ(wdog->status(DK_BROKER), SS_STOPPED);
}

TEST_F(WatchdogTest, BrokerStartupTimeoutIsFatal) {
    cfg.supervisor.startup_timeout = milliseconds(500);
    spec_of(cfg, DK_BROKER).args = {"--silent"};
    launch();
    EXPECT_EQ(finish(), EXIT_BROKER_FAILED);
    EXPECT_EQ(events.count(SET_SPAWNED, DK_MONITOR), 0u);
    EXPECT_EQ(events.count(SET_SPAWNED, DK_MANAGER), 0u);
}

TEST_F(WatchdogTest, MonitorRestartedOnceThenStable) {
    spec_of(cfg, DK_MONITOR).args = {"--once-marker", dir.file("monitor.once"),
                                     "--exit-after-ms", "200"};
    launch();

    ASSERT_TRUE(wait_until([this] {
        SupervisorStats st = wdog->stats(DK_MONITOR);
        return st.restarts == 1 && st.state == SS_RUNNING && st.failures == 0;
    }, milliseconds(10000)));
    // stays stable
    std::this_thread::sleep_for(milliseconds(500));

    SupervisorStats st = wdog->stats(DK_MONITOR);
    EXPECT_EQ(st.restarts, 1u);
    EXPECT_EQ(st.spawns, 2u);
    EXPECT_EQ(wdog->stats(DK_BROKER).restarts, 0u);
    EXPECT_EQ(wdog->stats(DK_MANAGER).restarts, 0u);

    wdog->request_shutdown();
    EXPECT_EQ(finish(), EXIT_OK);
}

TEST_F(WatchdogTest, AlreadyRunning) {
    cfg.check_running = true;
    boost::filesystem::create_directories(cfg.sockets_path);
    PingResponder resp(spec_of(cfg, DK_BROKER).socket_path);
    ASSERT_EQ(resp.start(), 0);

    launch();
    EXPECT_EQ(finish(), EXIT_ALREADY_RUNNING);
    EXPECT_TRUE(events.get().empty());
}

TEST_F(WatchdogTest, PermanentFailureExitCode) {
    cfg.restart.max_retries = 1;
    spec_of(cfg, DK_MANAGER).args = {"--exit-after-ms", "50", "--exit-code", "2"};
    launch();

    ASSERT_TRUE(wait_until([this] {
        return wdog->status(DK_MANAGER) == SS_FAILED_PERMANENTLY;
    }, milliseconds(10000)));
    // others unaffected
    EXPECT_EQ(wdog->status(DK_BROKER), SS_RUNNING);
    EXPECT_TRUE(wait_until([this] {
        return wdog->status(DK_MONITOR) == SS_RUNNING;
    }, milliseconds(5000)));
    EXPECT_TRUE(wdog->health()["failed"].get<bool>());

    wdog->request_shutdown();
    EXPECT_EQ(finish(), EXIT_DAEMON_FAILED);
}

TEST_F(WatchdogTest, ShutdownOnFailure) {
    cfg.shutdown_on_failure = true;
    cfg.restart.max_retries = 0;
    spec_of(cfg, DK_MONITOR).args = {"--exit-after-ms", "50"};
    launch();

    EXPECT_EQ(finish(), EXIT_DAEMON_FAILED);
    EXPECT_EQ(wdog->status(DK_BROKER), SS_STOPPED);
    EXPECT_EQ(wdog->status(DK_MANAGER), SS_STOPPED);
}

TEST_F(WatchdogTest, ShutdownDuringBrokerStartup) {
    spec_of(cfg, DK_BROKER).args = {"--startup-delay-ms", "2000"};
    launch();
    ASSERT_TRUE(wait_until([this] {
        return events.count(SET_SPAWNED, DK_BROKER) == 1;
    }, milliseconds(5000)));

    wdog->request_shutdown();
    EXPECT_EQ(finish(milliseconds(5000)), EXIT_OK);
    EXPECT_EQ(events.count(SET_SPAWNED, DK_MONITOR), 0u);
    EXPECT_EQ(wdog->status(DK_BROKER), SS_STOPPED);
}

TEST_F(WatchdogTest, LogRotationForwarded) {
    std::string marker = dir.file("broker.usr1");
    spec_of(cfg, DK_BROKER).args = {"--usr1-file", marker};
    launch();
    ASSERT_TRUE(wait_until([this] { return all_running(); }, milliseconds(10000)));

    wdog->request_log_rotation();
    EXPECT_TRUE(wait_until([&marker] {
        return boost::filesystem::exists(marker);
    }, milliseconds(3000)));
    EXPECT_EQ(wdog->stats(DK_BROKER).restarts, 0u);

    wdog->request_shutdown();
    EXPECT_EQ(finish(), EXIT_OK);
}
