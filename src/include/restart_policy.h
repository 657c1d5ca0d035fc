/*
 * SPDX-License-Identifier: MIT
 *
 */

#ifndef VIGIL_RESTART_POLICY_H_
#define VIGIL_RESTART_POLICY_H_

#include <chrono>
#include <deque>
#include <stdint.h>
#include <vigil_utils.h>

namespace vigil {
    using steady_clock = std::chrono::steady_clock;

    /**
     * Restart policy parameters
     */
    struct RestartConfig {
        /** delay before first restart */
        std::chrono::milliseconds initial_delay{1000};
        /** delay cap */
        std::chrono::milliseconds max_delay{60000};
        /** backoff multiplier */
        double multiplier = 2.0;
        /** relative jitter, delay is scaled by [1 - jitter, 1 + jitter] */
        double jitter = 0.2;
        /** maximum number of failures tolerated inside window */
        unsigned int max_retries = 5;
        /** sliding window for max_retries */
        std::chrono::milliseconds window{300000};
    };

    /**
     * Per daemon failure bookkeeping
     */
    struct RestartCounter {
        /** consecutive failures since last reset */
        unsigned int failures = 0;
        /** failure timestamps inside sliding window */
        std::deque<steady_clock::time_point> history;
        /** last restart timestamp */
        steady_clock::time_point last_restart;
    };

    /**
     * Bounded exponential backoff with jitter
     */
    class RestartPolicy {
    public:
        explicit RestartPolicy(const RestartConfig &_cfg);
        RestartPolicy(const RestartConfig &_cfg, uint32_t seed);

        /**
         * Register failure and drop history outside sliding window
         * @param[in,out]   counter     Restart counter
         * @param[in]       now         Failure timestamp
         */
        void record_failure(RestartCounter &counter,
                            steady_clock::time_point now) const;

        /**
         * Reset counter after stability window
         * @param[in,out]   counter     Restart counter
         */
        void reset(RestartCounter &counter) const;

        /**
         * Backoff delay without jitter; non-decreasing in
         * number of failures and capped at max_delay
         * @param[in]   counter     Restart counter
         * @return      Delay
         */
        std::chrono::milliseconds nominal_delay(const RestartCounter &counter) const;

        /**
         * Backoff delay with jitter applied
         * @param[in]   counter     Restart counter
         * @return      Delay
         */
        std::chrono::milliseconds next_delay(const RestartCounter &counter);

        /**
         * Check if retry ceiling was exceeded inside sliding window
         * @param[in]   counter     Restart counter
         * @return      True if daemon should not be restarted again
         */
        bool should_give_up(const RestartCounter &counter) const;

        const RestartConfig &get_config() const;

    private:
        RestartConfig cfg;
        vigil_utils::Randomizer rnd;
    };
}

#endif /* VIGIL_RESTART_POLICY_H_ */
