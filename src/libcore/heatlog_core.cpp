#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/file.h>
#include <unistd.h>

#include "libcore/daemon_config.hpp"
#include "libcore/data_logger.hpp"
#include "libcore/heatlog_core.hpp"
#include "libcore/log.hpp"
#include "libcore/log_writer.hpp"
#include "libcore/status_report.hpp"

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int /* sig */) {
    g_stop = 1;
}

std::optional<pid_t> try_read_pid(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    long long pid = 0;
    in >> pid;
    if (in.fail()) {
        return std::nullopt;
    }
    if (pid <= 0 || pid > static_cast<long long>(std::numeric_limits<pid_t>::max())) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

class InstanceLock {
public:
    explicit InstanceLock(const std::string &pidfile) : lockfile_(pidfile + ".lock") {
        fd_ = ::open(lockfile_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("cannot open lock file " + lockfile_ + ": " + std::strerror(errno));
        }

        if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            const int err = errno;
            std::string msg = "cannot acquire lock " + lockfile_ + ": " + std::strerror(err);
            const auto existing_pid = try_read_pid(pidfile);
            if (existing_pid) {
                msg += " (already running as pid " + std::to_string(*existing_pid) + ")";
            }
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error(msg);
        }
    }

    ~InstanceLock() {
        if (fd_ >= 0) {
            (void)::flock(fd_, LOCK_UN);
            (void)::close(fd_);
        }
    }

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

private:
    int fd_ = -1;
    std::string lockfile_;
};

class PidfileGuard {
public:
    explicit PidfileGuard(std::string pidfile) : pidfile_(std::move(pidfile)) {
        std::ofstream pid(pidfile_);
        if (!pid) {
            throw std::runtime_error("cannot create pidfile: " + pidfile_);
        }
        pid << ::getpid() << '\n';
        if (!pid.good()) {
            throw std::runtime_error("cannot write pidfile: " + pidfile_);
        }
    }

    ~PidfileGuard() {
        (void)::unlink(pidfile_.c_str());
    }

    PidfileGuard(const PidfileGuard &) = delete;
    PidfileGuard &operator=(const PidfileGuard &) = delete;

private:
    std::string pidfile_;
};

// Owns the status file for the daemon's lifetime; an empty path disables it.
class RuntimeStatusGuard {
public:
    explicit RuntimeStatusGuard(std::string path) : path_(std::move(path)) {}

    ~RuntimeStatusGuard() {
        if (!path_.empty()) {
            (void)::unlink(path_.c_str());
        }
    }

    bool write(const std::string &payload, std::string &error) const {
        if (path_.empty()) {
            return true;
        }
        return heatlog::core::write_runtime_status_file(path_, payload, error);
    }

    RuntimeStatusGuard(const RuntimeStatusGuard &) = delete;
    RuntimeStatusGuard &operator=(const RuntimeStatusGuard &) = delete;

private:
    std::string path_;
};

class DaemonOwnershipGuard {
public:
    explicit DaemonOwnershipGuard(const heatlog::core::DaemonConfig &cfg)
        : instance_lock_(cfg.pidfile), pidfile_guard_(cfg.pidfile), status_guard_(cfg.status_path) {}

    bool write_runtime_status(const std::string &payload, std::string &error) const {
        return status_guard_.write(payload, error);
    }

    DaemonOwnershipGuard(const DaemonOwnershipGuard &) = delete;
    DaemonOwnershipGuard &operator=(const DaemonOwnershipGuard &) = delete;

private:
    InstanceLock instance_lock_;
    PidfileGuard pidfile_guard_;
    RuntimeStatusGuard status_guard_;
};

void apply_log_level(const heatlog::core::DaemonConfig &cfg) {
    const auto d = std::getenv("DEBUG");
    if (d && *d && std::string(d) != "0") {
        heatlog::core::set_log_level(heatlog::core::LogLevel::Debug);
        return;
    }
    const auto level = heatlog::core::parse_log_level(cfg.log_level);
    heatlog::core::set_log_level(level.value_or(heatlog::core::LogLevel::Info));
}

int run_daemon(const heatlog::core::DaemonConfig &cfg) {
    DaemonOwnershipGuard ownership_guard(cfg);
    heatlog::core::RateLimitedLog status_log("status", 1, std::chrono::seconds(300));

    heatlog::core::DataLogger logger(cfg, heatlog::core::make_broker_session(cfg));
    logger.start();
    heatlog::core::log_info("heatlog", "started with " + std::to_string(cfg.sources.size()) + " sources");

    while (!g_stop) {
        const std::string payload = heatlog::core::build_runtime_status_json(logger.store(), logger.runtime_status());
        std::string error;
        if (!ownership_guard.write_runtime_status(payload, error)) {
            status_log.log(heatlog::core::LogLevel::Warn, "failed to write runtime status: " + error);
        }

        for (int i = 0; i < cfg.interval_sec * 10 && !g_stop; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    heatlog::core::log_info("heatlog", "stopping");
    logger.stop();
    return 0;
}

int print_history(const heatlog::core::DaemonConfig &cfg, const std::string &id) {
    bool known = false;
    for (const auto &src : cfg.sources) {
        known = known || src.id == id;
    }
    if (!known) {
        throw std::runtime_error("unknown source id: " + id);
    }
    if (cfg.log_dir.empty()) {
        throw std::runtime_error("LOG_DIR is empty, nothing to replay");
    }

    const heatlog::core::LogWriter writer(heatlog::core::log_writer_options_from(cfg));
    const auto loaded = writer.load_recent(std::chrono::hours(cfg.history_hours));
    const auto it = loaded.readings.find(id);
    if (it == loaded.readings.end()) {
        return 0;
    }
    for (const auto &r : it->second) {
        std::cout << heatlog::core::encode_log_record(id, r) << '\n';
    }
    return 0;
}

std::string pick_config_path(const std::vector<std::string> &args, std::size_t offset) {
    if (args.size() > offset) {
        return args[offset];
    }
    return heatlog::core::kDefaultConfigPath;
}

} // namespace

namespace heatlog::core {

int run(const std::vector<std::string> &args) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGHUP, on_signal);
    std::signal(SIGQUIT, on_signal);

    try {
        if (args.size() > 1 && args[1] == "--validate-config") {
            const std::string config = pick_config_path(args, 2);
            const DaemonConfig cfg = load_daemon_config(config);
            std::cerr << "heatlog: config validation passed for " << config << " (" << cfg.sources.size()
                      << " sources)\n";
            return 0;
        }
        if (args.size() > 1 && args[1] == "--dump-config-json") {
            const std::string config = pick_config_path(args, 2);
            const DaemonConfig cfg = load_daemon_config(config);
            std::cout << build_config_json(cfg, config) << '\n';
            return 0;
        }
        if (args.size() > 1 && args[1] == "--dump-schema-json") {
            std::cout << dump_config_schema_json() << '\n';
            return 0;
        }
        if (args.size() > 1 && args[1] == "--print-history") {
            if (args.size() < 3) {
                std::cerr << "usage: heatlog --print-history <source id> [config]\n";
                return 2;
            }
            const DaemonConfig cfg = load_daemon_config(pick_config_path(args, 3));
            apply_log_level(cfg);
            return print_history(cfg, args[2]);
        }

        const std::string config = pick_config_path(args, 1);
        std::cerr << "Loading configuration from " << config << " ...\n";

        g_stop = 0;

        const DaemonConfig cfg = load_daemon_config(config);
        apply_log_level(cfg);
        return run_daemon(cfg);
    } catch (const std::exception &e) {
        std::cerr << "heatlog: " << e.what() << '\n';
        return 1;
    }
}

} // namespace heatlog::core
