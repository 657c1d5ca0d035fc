/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <restart_policy.h>
#include <cmath>

vigil::RestartPolicy::RestartPolicy(const RestartConfig &_cfg) : cfg(_cfg) {

}

vigil::RestartPolicy::RestartPolicy(const RestartConfig &_cfg,
                                    uint32_t seed) : cfg(_cfg),
                                                     rnd(seed) {

}

void vigil::RestartPolicy::record_failure(RestartCounter &counter,
                                          steady_clock::time_point now) const {
    ++counter.failures;
    counter.history.push_back(now);
    // slide window
    while (!counter.history.empty() &&
           (now - counter.history.front()) > cfg.window) {
        counter.history.pop_front();
    }
}

void vigil::RestartPolicy::reset(RestartCounter &counter) const {
    counter.failures = 0;
    counter.history.clear();
}

std::chrono::milliseconds
vigil::RestartPolicy::nominal_delay(const RestartCounter &counter) const {
    if (counter.failures == 0) return std::chrono::milliseconds(0);

    const double max_ms = static_cast<double>(cfg.max_delay.count());
    double d = static_cast<double>(cfg.initial_delay.count()) *
               std::pow(cfg.multiplier, static_cast<double>(counter.failures - 1));
    // pow can overflow to inf for large counts
    if (!std::isfinite(d) || d > max_ms) d = max_ms;
    return std::chrono::milliseconds(static_cast<int64_t>(d));
}

std::chrono::milliseconds
vigil::RestartPolicy::next_delay(const RestartCounter &counter) {
    auto nominal = nominal_delay(counter);
    if (cfg.jitter <= 0.0) return nominal;
    double f = rnd.uniform(1.0 - cfg.jitter, 1.0 + cfg.jitter);
    return std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(static_cast<double>(nominal.count()) * f)));
}

bool vigil::RestartPolicy::should_give_up(const RestartCounter &counter) const {
    return counter.history.size() > cfg.max_retries;
}

const vigil::RestartConfig &vigil::RestartPolicy::get_config() const {
    return cfg;
}
