#pragma once

#include <istream>
#include <string>
#include <vector>

namespace heatlog::core {

inline constexpr const char *kDefaultConfigPath = "/etc/heatlog.conf";
inline constexpr const char *kDefaultPidfilePath = "/var/run/heatlog.pid";
inline constexpr const char *kDefaultStatusPath = "/var/run/heatlog.status.json";
inline constexpr const char *kDefaultLogDir = "/var/lib/heatlog";
inline constexpr const char *kDefaultGpioChip = "/dev/gpiochip0";
inline constexpr const char *kDefaultW1DevicesDir = "/sys/bus/w1/devices";
inline constexpr const char *kSourceIdPattern = "^[A-Za-z0-9_.-]+$";

struct SourceConfig {
    std::string id;
    std::string type;

    std::string label;
    std::string group;
    std::string color;
    std::string unit;
    int decimals = 1;
    double offset = 0.0;
    bool with_graph = true;
    int poll_sec = 0;

    // w1
    std::string address;

    // tsic
    int gpio = -1;
    int tsic_model = 306;
    std::string chip;

    // sysfs
    std::string path;
    double scale = 0.001;

    // ubus
    std::string object;
    std::string method;
    std::string key;
    std::string args_json;

    // simulated
    std::string script;
    double mean = 20.0;
    double stddev = 0.0;
    unsigned seed = 1;
    std::string repeat;

    // delta
    std::string input_a;
    std::string input_b;
};

struct MqttConfig {
    std::string host;
    int port = 1883;
    std::string user;
    std::string password_file;
    bool tls = false;
    std::string ca_cert;
    std::string base_topic;
    std::string client_id;
    bool retain = true;
    int keepalive_sec = 60;
    int reconnect_min_sec = 1;
    int reconnect_max_sec = 60;
};

struct DaemonConfig {
    int interval_sec = 0;
    int read_timeout_ms = 0;
    int history_hours = 0;
    int history_spacing_sec = 0;
    int history_max_samples = 0;
    int stale_after_sec = 0;

    std::string log_dir;
    std::string log_basename;
    int retention_days = 0;
    bool log_fsync = true;
    int queue_capacity = 0;
    int drain_grace_ms = 0;

    std::string log_level;
    std::string pidfile;
    std::string status_path;
    std::string gpio_chip;
    std::string w1_devices_dir;

    MqttConfig mqtt;

    std::vector<SourceConfig> sources;
};

DaemonConfig default_daemon_config();
DaemonConfig parse_daemon_config(std::istream &in);
DaemonConfig load_daemon_config(const std::string &path);

// Cross-field and file checks; throws ConfigError.
void validate_daemon_config(const DaemonConfig &cfg);

std::string read_secret_file(const std::string &path);
std::string build_config_json(const DaemonConfig &cfg, const std::string &path);
std::string dump_config_schema_json();

} // namespace heatlog::core
