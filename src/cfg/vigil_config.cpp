/*
 * SPDX-License-Identifier: MIT
 *
 */

#include <vigil_config.h>
#include <vigil_utils.h>
#include <algorithm>
#include <climits>
#include <set>
#include <stdexcept>

// daemon descriptor table, dependency order
static const std::vector<vigil::DaemonKindInfo> DAEMON_KINDS = {
    {vigil::DK_BROKER,  "broker",  {}},
    {vigil::DK_MONITOR, "monitor", {vigil::DK_BROKER}},
    {vigil::DK_MANAGER, "manager", {vigil::DK_BROKER}}
};

// environment passed to children
static constexpr const char *ENV_DAEMON = "VIGIL_DAEMON";
static constexpr const char *ENV_SOCKET = "VIGIL_SOCKET";

const std::vector<vigil::DaemonKindInfo> &vigil::daemon_kinds() {
    return DAEMON_KINDS;
}

int vigil::daemon_kind_from_name(const std::string &name, DaemonKind &kind) {
    auto it = std::find_if(DAEMON_KINDS.cbegin(),
                           DAEMON_KINDS.cend(),
                           [&name](const DaemonKindInfo &k) {
                               return name == k.name;
                           });
    if (it == DAEMON_KINDS.cend()) return 1;
    kind = it->kind;
    return 0;
}

const char *vigil::daemon_kind_name(DaemonKind kind) {
    for (auto &k : DAEMON_KINDS) {
        if (k.kind == kind) return k.name;
    }
    return "unknown";
}

static std::string default_executable(const std::string &bindir,
                                      const std::string &name) {
    return bindir + "/vigil-" + name;
}

// refresh socket paths and child environment
static void update_paths(vigil::WatchdogConfig &cfg) {
    if (cfg.sockets_path.empty())
        cfg.sockets_path = cfg.data_path + "/sockets";

    for (auto &d : cfg.daemons) {
        d.socket_path = cfg.sockets_path + "/" + d.name + ".sock";
        d.env[ENV_DAEMON] = d.name;
        d.env[ENV_SOCKET] = d.socket_path;
    }
}

vigil::WatchdogConfig vigil::WatchdogConfig::defaults() {
    WatchdogConfig cfg;
    for (auto &k : DAEMON_KINDS) {
        DaemonSpec d;
        d.kind = k.kind;
        d.name = k.name;
        d.depends_on = k.depends_on;
        d.executable = default_executable(cfg.bindir, d.name);
        cfg.daemons.push_back(d);
    }
    cfg.available = cfg.daemons;
    update_paths(cfg);
    return cfg;
}

const vigil::DaemonSpec *vigil::WatchdogConfig::find(DaemonKind kind) const {
    for (auto &d : daemons) {
        if (d.kind == kind) return &d;
    }
    return nullptr;
}

void vigil::WatchdogConfig::set_bindir(const std::string &_bindir) {
    auto upd = [this, &_bindir](DaemonSpec &d) {
        // only update paths not set explicitly
        if (d.executable == default_executable(bindir, d.name))
            d.executable = default_executable(_bindir, d.name);
    };
    std::for_each(daemons.begin(), daemons.end(), upd);
    std::for_each(available.begin(), available.end(), upd);
    bindir = _bindir;
}

void vigil::WatchdogConfig::select_daemons(const std::vector<std::string> &names) {
    std::set<DaemonKind> sel;
    for (auto &n : names) {
        DaemonKind k;
        if (daemon_kind_from_name(n, k))
            throw std::invalid_argument("unknown daemon '" + n + "'");
        sel.insert(k);
        // implicit dependencies
        for (auto &ki : DAEMON_KINDS) {
            if (ki.kind == k) sel.insert(ki.depends_on.cbegin(), ki.depends_on.cend());
        }
    }
    if (sel.empty())
        throw std::invalid_argument("no daemons selected");

    daemons.erase(std::remove_if(daemons.begin(),
                                 daemons.end(),
                                 [&sel](const DaemonSpec &d) {
                                     return sel.find(d.kind) == sel.end();
                                 }),
                  daemons.end());

    // add back those removed earlier (e.g. disabled in file)
    for (auto &ki : DAEMON_KINDS) {
        if (sel.find(ki.kind) == sel.end() || find(ki.kind) != nullptr)
            continue;
        DaemonSpec d;
        auto ait = std::find_if(available.cbegin(),
                                available.cend(),
                                [&ki](const DaemonSpec &o) {
                                    return o.kind == ki.kind;
                                });
        if (ait != available.cend()) {
            d = *ait;
        } else {
            d.kind = ki.kind;
            d.name = ki.name;
            d.depends_on = ki.depends_on;
            d.executable = default_executable(bindir, d.name);
        }
        // keep dependency order
        auto pos = std::find_if(daemons.begin(),
                                daemons.end(),
                                [&d](const DaemonSpec &o) {
                                    return o.kind > d.kind;
                                });
        daemons.insert(pos, d);
    }
    update_paths(*this);
}

/*******************/
/* JSON helpers    */
/*******************/
static void get_ms(const json &j, const char *key, std::chrono::milliseconds &dst) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!(*it).is_number_integer() || (*it).get<int64_t>() <= 0)
        throw std::invalid_argument(std::string(key) + " must be a positive integer");
    dst = std::chrono::milliseconds((*it).get<int64_t>());
}

static void get_uint(const json &j, const char *key, unsigned int &dst, bool allow_zero) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!(*it).is_number_integer() || (*it).get<int64_t>() < (allow_zero ? 0 : 1))
        throw std::invalid_argument(std::string(key) + " must be a " +
                                    (allow_zero ? "non-negative" : "positive") +
                                    " integer");
    if ((*it).is_number_unsigned() && (*it).get<uint64_t>() > UINT_MAX)
        throw std::invalid_argument(std::string(key) + " is out of range");
    dst = (*it).get<unsigned int>();
}

static void get_str(const json &j, const char *key, std::string &dst) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!(*it).is_string())
        throw std::invalid_argument(std::string(key) + " must be a string");
    dst = (*it).get<std::string>();
}

static void get_bool(const json &j, const char *key, bool &dst) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!(*it).is_boolean())
        throw std::invalid_argument(std::string(key) + " must be a boolean");
    dst = (*it).get<bool>();
}

static void get_double(const json &j, const char *key, double &dst) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!(*it).is_number())
        throw std::invalid_argument(std::string(key) + " must be a number");
    dst = (*it).get<double>();
}

static void parse_daemon(const json &j, vigil::DaemonSpec &d, bool &enabled) {
    if (!j.is_object())
        throw std::invalid_argument("daemon '" + d.name + "' must be an object");

    get_bool(j, "enabled", enabled);
    get_str(j, "executable", d.executable);

    // arguments
    auto it = j.find("args");
    if (it != j.end()) {
        if (!(*it).is_array())
            throw std::invalid_argument("daemon '" + d.name + "' args must be an array");
        d.args.clear();
        for (auto &a : *it) {
            if (!a.is_string())
                throw std::invalid_argument("daemon '" + d.name + "' args must be strings");
            d.args.push_back(a.get<std::string>());
        }
    }

    // extra environment
    it = j.find("env");
    if (it != j.end()) {
        if (!(*it).is_object())
            throw std::invalid_argument("daemon '" + d.name + "' env must be an object");
        for (auto e = (*it).begin(); e != (*it).end(); ++e) {
            if (!e.value().is_string())
                throw std::invalid_argument("daemon '" + d.name + "' env values must be strings");
            d.env[e.key()] = e.value().get<std::string>();
        }
    }
}

vigil::WatchdogConfig vigil::WatchdogConfig::from_json(const json &j) {
    if (!j.is_object())
        throw std::invalid_argument("configuration must be a JSON object");

    WatchdogConfig cfg = defaults();
    cfg.sockets_path.clear();

    // top level
    get_str(j, "log_level", cfg.log_level);
    get_str(j, "data_path", cfg.data_path);
    get_str(j, "sockets_path", cfg.sockets_path);
    get_str(j, "pid_file", cfg.pid_file);
    get_bool(j, "check_running", cfg.check_running);
    get_bool(j, "shutdown_on_failure", cfg.shutdown_on_failure);
    std::string bdir = cfg.bindir;
    get_str(j, "bindir", bdir);
    cfg.set_bindir(bdir);

    static const std::set<std::string> levels = {"debug", "info", "warning", "error"};
    if (levels.find(cfg.log_level) == levels.end())
        throw std::invalid_argument("invalid log_level '" + cfg.log_level + "'");

    // supervisor timing
    auto it = j.find("supervisor");
    if (it != j.end()) {
        const json &s = *it;
        if (!s.is_object())
            throw std::invalid_argument("supervisor must be an object");
        get_ms(s, "poll_interval_ms", cfg.supervisor.poll_interval);
        get_ms(s, "startup_poll_interval_ms", cfg.supervisor.startup_poll_interval);
        get_ms(s, "ping_timeout_ms", cfg.supervisor.ping_timeout);
        get_uint(s, "ping_failure_threshold", cfg.supervisor.ping_failure_threshold, false);
        get_ms(s, "startup_timeout_ms", cfg.supervisor.startup_timeout);
        get_ms(s, "grace_period_ms", cfg.supervisor.grace_period);
        get_ms(s, "stability_window_ms", cfg.supervisor.stability_window);
    }

    // restart policy
    it = j.find("restart");
    if (it != j.end()) {
        const json &r = *it;
        if (!r.is_object())
            throw std::invalid_argument("restart must be an object");
        get_ms(r, "initial_delay_ms", cfg.restart.initial_delay);
        get_ms(r, "max_delay_ms", cfg.restart.max_delay);
        get_double(r, "multiplier", cfg.restart.multiplier);
        get_double(r, "jitter", cfg.restart.jitter);
        get_uint(r, "max_retries", cfg.restart.max_retries, true);
        get_ms(r, "window_ms", cfg.restart.window);
    }
    if (cfg.restart.multiplier < 1.0)
        throw std::invalid_argument("multiplier must be >= 1");
    if (cfg.restart.jitter < 0.0 || cfg.restart.jitter >= 1.0)
        throw std::invalid_argument("jitter must be in [0, 1)");
    if (cfg.restart.max_delay < cfg.restart.initial_delay)
        throw std::invalid_argument("max_delay_ms must be >= initial_delay_ms");

    // daemons
    it = j.find("daemons");
    if (it != j.end()) {
        const json &dj = *it;
        // list of names
        if (dj.is_array()) {
            std::vector<std::string> names;
            for (auto &n : dj) {
                if (!n.is_string())
                    throw std::invalid_argument("daemons must be strings");
                names.push_back(n.get<std::string>());
            }
            cfg.select_daemons(names);

        // per daemon objects
        } else if (dj.is_object()) {
            std::vector<std::string> enabled_names;
            for (auto dit = dj.begin(); dit != dj.end(); ++dit) {
                DaemonKind k;
                if (daemon_kind_from_name(dit.key(), k))
                    throw std::invalid_argument("unknown daemon '" + dit.key() + "'");
            }
            for (auto &d : cfg.daemons) {
                bool enabled = true;
                auto dit = dj.find(d.name);
                if (dit != dj.end()) parse_daemon(*dit, d, enabled);
                if (enabled) enabled_names.push_back(d.name);
            }
            cfg.available = cfg.daemons;
            if (enabled_names.empty())
                throw std::invalid_argument("no daemons enabled");
            // disabled dependencies are re-added by selection
            cfg.select_daemons(enabled_names);

        } else {
            throw std::invalid_argument("daemons must be an array or an object");
        }
    }

    update_paths(cfg);
    return cfg;
}

vigil::WatchdogConfig vigil::WatchdogConfig::from_file(const std::string &path) {
    // check file size
    int sz = vigil_utils::get_file_size(path.c_str());
    if (sz <= 0)
        throw std::invalid_argument("cannot read configuration file '" + path + "'");

    // read data
    std::vector<char> buff(sz);
    if (vigil_utils::load_file(path.c_str(), buff.data(), &sz))
        throw std::invalid_argument("cannot read configuration file '" + path + "'");
    buff.resize(sz);

    // parse JSON
    json j = json::parse(buff.cbegin(), buff.cend(), nullptr, false);
    if (j.is_discarded())
        throw std::invalid_argument("malformed JSON in '" + path + "'");

    return from_json(j);
}
