/*
 * SPDX-License-Identifier: MIT
 *
 */

// RestartPolicy: bounded exponential backoff, jitter, retry ceiling

#include <gtest/gtest.h>
#include <restart_policy.h>

using namespace vigil;
using std::chrono::milliseconds;

static RestartConfig test_restart_config() {
    RestartConfig cfg;
    cfg.initial_delay = milliseconds(100);
    cfg.max_delay = milliseconds(3000);
    cfg.multiplier = 2.0;
    cfg.jitter = 0.2;
    cfg.max_retries = 3;
    cfg.window = milliseconds(1000);
    return cfg;
}

TEST(RestartPolicy, NominalDelayGrowsAndIsCapped) {
    RestartConfig cfg = test_restart_config();
    RestartPolicy p(cfg, 1);
    RestartCounter c;
    auto now = steady_clock::now();

    EXPECT_EQ(p.nominal_delay(c).count(), 0);

    milliseconds prev(0);
    for (int i = 1; i <= 64; i++) {
        p.record_failure(c, now);
        milliseconds d = p.nominal_delay(c);
        EXPECT_GE(d, prev) << "failure " << i;
        EXPECT_LE(d, cfg.max_delay) << "failure " << i;
        prev = d;
    }
    EXPECT_EQ(prev, cfg.max_delay);
}

TEST(RestartPolicy, FirstDelaysFollowMultiplier) {
    RestartConfig cfg = test_restart_config();
    RestartPolicy p(cfg, 1);
    RestartCounter c;
    auto now = steady_clock::now();

    p.record_failure(c, now);
    EXPECT_EQ(p.nominal_delay(c).count(), 100);
    p.record_failure(c, now);
    EXPECT_EQ(p.nominal_delay(c).count(), 200);
    p.record_failure(c, now);
    EXPECT_EQ(p.nominal_delay(c).count(), 400);
}

/**
 * Jittered delay stays inside [nominal * (1 - j), nominal * (1 + j)]
 * (1 ms slack for rounding)
 */
TEST(RestartPolicy, JitterWithinBounds) {
    RestartConfig cfg = test_restart_config();
    RestartPolicy p(cfg, 42);
    RestartCounter c;
    auto now = steady_clock::now();

    for (int i = 1; i <= 10; i++) {
        p.record_failure(c, now);
        double nominal = static_cast<double>(p.nominal_delay(c).count());
        for (int k = 0; k < 50; k++) {
            double d = static_cast<double>(p.next_delay(c).count());
            EXPECT_GE(d, nominal * (1.0 - cfg.jitter) - 1.0);
            EXPECT_LE(d, nominal * (1.0 + cfg.jitter) + 1.0);
        }
    }
}

TEST(RestartPolicy, ZeroJitterIsNominal) {
    RestartConfig cfg = test_restart_config();
    cfg.jitter = 0.0;
    RestartPolicy p(cfg);
    RestartCounter c;
    auto now = steady_clock::now();
    for (int i = 0; i < 5; i++) {
        p.record_failure(c, now);
        EXPECT_EQ(p.next_delay(c), p.nominal_delay(c));
    }
}

TEST(RestartPolicy, SeededSequenceIsReproducible) {
    RestartConfig cfg = test_restart_config();
    RestartPolicy p1(cfg, 7);
    RestartPolicy p2(cfg, 7);
    RestartCounter c;
    p1.record_failure(c, steady_clock::now());
    for (int i = 0; i < 20; i++) EXPECT_EQ(p1.next_delay(c), p2.next_delay(c));
}

TEST(RestartPolicy, GiveUpWhenCeilingExceeded) {
    RestartPolicy p(test_restart_config(), 1);
    RestartCounter c;
    auto now = steady_clock::now();

    for (int i = 0; i < 3; i++) {
        p.record_failure(c, now + milliseconds(i));
        EXPECT_FALSE(p.should_give_up(c));
    }
    p.record_failure(c, now + milliseconds(3));
    EXPECT_TRUE(p.should_give_up(c));
}

TEST(RestartPolicy, FailuresOutsideWindowAreForgotten) {
    RestartPolicy p(test_restart_config(), 1);
    RestartCounter c;
    auto now = steady_clock::now();

    for (int i = 0; i < 3; i++) p.record_failure(c, now);
    // window is 1000 ms
    p.record_failure(c, now + milliseconds(2000));
    EXPECT_EQ(c.history.size(), 1u);
    EXPECT_EQ(c.failures, 4u);
    EXPECT_FALSE(p.should_give_up(c));
}

TEST(RestartPolicy, ResetClearsCounter) {
    RestartPolicy p(test_restart_config(), 1);
    RestartCounter c;
    auto now = steady_clock::now();
    for (int i = 0; i < 5; i++) p.record_failure(c, now);
    ASSERT_TRUE(p.should_give_up(c));

    p.reset(c);
    EXPECT_EQ(c.failures, 0u);
    EXPECT_TRUE(c.history.empty());
    EXPECT_FALSE(p.should_give_up(c));
    EXPECT_EQ(p.nominal_delay(c).count(), 0);
}

TEST(RestartPolicy, ZeroRetriesGivesUpOnFirstFailure) {
    RestartConfig cfg = test_restart_config();
    cfg.max_retries = 0;
    RestartPolicy p(cfg, 1);
    RestartCounter c;
    p.record_failure(c, steady_clock::now());
    EXPECT_TRUE(p.should_give_up(c));
}
