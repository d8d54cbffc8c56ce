#include "libcore/daemon_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <map>
#include <regex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "libcore/config_spec.hpp"
#include "libcore/errors.hpp"
#include "libcore/log.hpp"
#include "libcore/sensor_driver.hpp"
#include "libcore/tsic_driver.hpp"

namespace heatlog::core {
namespace {

std::string trim(const std::string &s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string unquote(const std::string &s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

int to_int(const std::string &in, const std::string &name) {
    try {
        std::size_t idx = 0;
        long long v = std::stoll(in, &idx, 10);
        if (idx != in.size()) {
            throw ConfigError("");
        }
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            throw ConfigError("");
        }
        return static_cast<int>(v);
    } catch (...) {
        throw ConfigError("invalid integer for " + name + ": " + in);
    }
}

double to_double(const std::string &in, const std::string &name) {
    try {
        std::size_t idx = 0;
        const double v = std::stod(in, &idx);
        if (idx != in.size()) {
            throw ConfigError("");
        }
        return v;
    } catch (...) {
        throw ConfigError("invalid number for " + name + ": " + in);
    }
}

bool to_bool(const std::string &in, const std::string &name) {
    std::string lower = trim(in);
    for (char &c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        return false;
    }

    throw ConfigError("invalid boolean for " + name + ": " + in);
}

void clamp_field(int &v, const IntFieldSpec &spec) {
    if (v < spec.min_value) {
        v = spec.min_value;
    }
    if (spec.has_max && v > spec.max_value) {
        v = spec.max_value;
    }
}

bool is_valid_color(const std::string &color) {
    if (color.size() != 7 && color.size() != 9) {
        return false;
    }
    if (color[0] != '#') {
        return false;
    }
    return std::all_of(color.begin() + 1, color.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

std::unordered_map<std::string, std::string> parse_csv_pairs(const std::string &v) {
    std::vector<std::string> tokens;
    std::string current;
    int brace_depth = 0;
    int bracket_depth = 0;
    bool in_quote = false;
    bool escape = false;
    char quote = '\0';

    for (char ch : v) {
        if (in_quote) {
            current.push_back(ch);
            if (escape) {
                escape = false;
                continue;
            }
            if (ch == '\\') {
                escape = true;
                continue;
            }
            if (ch == quote) {
                in_quote = false;
            }
            continue;
        }

        if (ch == '"' || ch == '\'') {
            in_quote = true;
            quote = ch;
            current.push_back(ch);
            continue;
        }
        if (ch == '{') {
            ++brace_depth;
        } else if (ch == '}' && brace_depth > 0) {
            --brace_depth;
        } else if (ch == '[') {
            ++bracket_depth;
        } else if (ch == ']' && bracket_depth > 0) {
            --bracket_depth;
        }

        if (ch == ',' && brace_depth == 0 && bracket_depth == 0) {
            tokens.push_back(trim(current));
            current.clear();
            continue;
        }

        current.push_back(ch);
    }
    tokens.push_back(trim(current));

    std::unordered_map<std::string, std::string> kv;
    for (const auto &token_raw : tokens) {
        const std::string token = trim(token_raw);
        if (!token.empty()) {
            const std::size_t eq = token.find('=');
            if (eq == std::string::npos || eq == 0 || eq + 1 >= token.size()) {
                throw ConfigError("bad source token: " + token);
            }
            const std::string k = trim(token.substr(0, eq));
            const std::string val = unquote(trim(token.substr(eq + 1)));
            if (!kv.emplace(k, val).second) {
                throw ConfigError("duplicate source field: " + k);
            }
        }
    }

    return kv;
}

SourceConfig parse_source_line(const std::string &id, const std::string &rhs, const DaemonConfig &cfg) {
    const ConfigSpec &spec = daemon_config_spec();
    static const std::regex id_pattern(spec.source_id_pattern);
    if (!std::regex_match(id, id_pattern)) {
        throw ConfigError("invalid source id: " + id);
    }

    SourceConfig src;
    src.id = id;

    const auto kv = parse_csv_pairs(rhs);
    if (!kv.count("type")) {
        throw ConfigError("SOURCE_" + id + " missing required field: type");
    }
    src.type = kv.at("type");

    const SourceTypeSpec *type_spec = find_source_type(src.type.c_str());
    if (!type_spec) {
        throw ConfigError("unsupported source type for SOURCE_" + id + ": " + src.type);
    }
    for (std::size_t i = 0; i < type_spec->required_count; ++i) {
        if (!kv.count(type_spec->required_fields[i])) {
            throw ConfigError("SOURCE_" + id + " missing required field for " + src.type + ": " +
                              type_spec->required_fields[i]);
        }
    }

    const auto get = [&kv](const char *key, const std::string &fallback) {
        const auto it = kv.find(key);
        return it == kv.end() ? fallback : it->second;
    };

    src.label = get("label", id);
    src.group = get("group", "");
    src.color = get("color", spec.source_default_color);
    src.unit = get("unit", src.type == "delta" ? "K" : spec.source_default_unit);
    src.decimals = kv.count("decimals") ? to_int(kv.at("decimals"), "decimals") : spec.source_decimals.default_value;
    clamp_field(src.decimals, spec.source_decimals);
    src.offset = kv.count("offset") ? to_double(kv.at("offset"), "offset") : 0.0;
    src.with_graph = kv.count("graph") ? to_bool(kv.at("graph"), "graph") : true;
    src.poll_sec = kv.count("poll") ? to_int(kv.at("poll"), "poll") : cfg.interval_sec;
    if (src.poll_sec < 1) {
        src.poll_sec = 1;
    }

    if (!is_valid_color(src.color)) {
        throw ConfigError("invalid color for SOURCE_" + id + ": " + src.color);
    }

    if (src.type == "w1") {
        src.address = kv.at("address");
    } else if (src.type == "tsic") {
        src.gpio = to_int(kv.at("gpio"), "gpio");
        if (src.gpio < 0) {
            throw ConfigError("invalid gpio for SOURCE_" + id + ": " + kv.at("gpio"));
        }
        src.tsic_model = kv.count("model") ? to_int(kv.at("model"), "model") : spec.source_tsic_model.default_value;
        if (!tsic_model_from_number(src.tsic_model)) {
            throw ConfigError("unsupported TSIC model for SOURCE_" + id + ": " + std::to_string(src.tsic_model));
        }
        src.chip = get("chip", cfg.gpio_chip);
    } else if (src.type == "sysfs") {
        src.path = kv.at("path");
        src.scale = kv.count("scale") ? to_double(kv.at("scale"), "scale") : 0.001;
    } else if (src.type == "ubus") {
        src.object = kv.at("object");
        src.method = kv.at("method");
        src.key = kv.at("key");
        src.args_json = get("args", "{}");
    } else if (src.type == "simulated") {
        src.script = get("script", "");
        src.mean = kv.count("mean") ? to_double(kv.at("mean"), "mean") : 20.0;
        src.stddev = kv.count("stddev") ? to_double(kv.at("stddev"), "stddev") : 0.0;
        src.seed = kv.count("seed") ? static_cast<unsigned>(to_int(kv.at("seed"), "seed")) : 1U;
        src.repeat = get("repeat", "last");
        if (src.repeat != "last" && src.repeat != "cycle") {
            throw ConfigError("invalid repeat mode for SOURCE_" + id + ": " + src.repeat);
        }
        if (src.stddev < 0.0) {
            throw ConfigError("negative stddev for SOURCE_" + id);
        }
        std::string error;
        if (!parse_simulated_script(src.script, error)) {
            throw ConfigError("invalid script for SOURCE_" + id + ": " + error);
        }
    } else if (src.type == "delta") {
        src.input_a = kv.at("a");
        src.input_b = kv.at("b");
    }

    return src;
}

} // namespace

DaemonConfig default_daemon_config() {
    const ConfigSpec &spec = daemon_config_spec();

    DaemonConfig cfg;
    cfg.interval_sec = spec.interval_sec.default_value;
    cfg.read_timeout_ms = spec.read_timeout_ms.default_value;
    cfg.history_hours = spec.history_hours.default_value;
    cfg.history_spacing_sec = spec.history_spacing_sec.default_value;
    cfg.history_max_samples = spec.history_max_samples.default_value;
    cfg.stale_after_sec = spec.stale_after_sec.default_value;
    cfg.retention_days = spec.retention_days.default_value;
    cfg.queue_capacity = spec.queue_capacity.default_value;
    cfg.drain_grace_ms = spec.drain_grace_ms.default_value;

    cfg.log_dir = spec.log_dir.default_value;
    cfg.log_basename = spec.log_basename.default_value;
    cfg.log_fsync = spec.log_fsync.default_value;
    cfg.log_level = spec.log_level.default_value;
    cfg.pidfile = spec.pidfile.default_value;
    cfg.status_path = spec.status_path.default_value;
    cfg.gpio_chip = spec.gpio_chip.default_value;
    cfg.w1_devices_dir = spec.w1_devices_dir.default_value;

    cfg.mqtt.host = spec.mqtt_host.default_value;
    cfg.mqtt.port = spec.mqtt_port.default_value;
    cfg.mqtt.user = spec.mqtt_user.default_value;
    cfg.mqtt.password_file = spec.mqtt_password_file.default_value;
    cfg.mqtt.tls = spec.mqtt_tls.default_value;
    cfg.mqtt.ca_cert = spec.mqtt_ca_cert.default_value;
    cfg.mqtt.base_topic = spec.mqtt_base_topic.default_value;
    cfg.mqtt.client_id = spec.mqtt_client_id.default_value;
    cfg.mqtt.retain = spec.mqtt_retain.default_value;
    cfg.mqtt.keepalive_sec = spec.mqtt_keepalive_sec.default_value;
    cfg.mqtt.reconnect_min_sec = spec.mqtt_reconnect_min_sec.default_value;
    cfg.mqtt.reconnect_max_sec = spec.mqtt_reconnect_max_sec.default_value;
    return cfg;
}

DaemonConfig parse_daemon_config(std::istream &in) {
    const ConfigSpec &spec = daemon_config_spec();

    std::map<std::string, std::string> plain;
    std::vector<std::pair<std::string, std::string>> sources;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        // '#' also starts a color value, so only whole-line comments are supported
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string value = unquote(trim(line.substr(eq + 1)));

        if (key.rfind("SOURCE_", 0) == 0 && key.size() > 7) {
            sources.emplace_back(key.substr(7), value);
        } else {
            plain[key] = value;
        }
    }

    DaemonConfig cfg = default_daemon_config();

    const auto read_int = [&plain](const IntFieldSpec &field, int &target) {
        const auto it = plain.find(field.key);
        if (it != plain.end()) {
            target = to_int(it->second, field.key);
        }
        clamp_field(target, field);
    };
    const auto read_string = [&plain](const StringFieldSpec &field, std::string &target) {
        const auto it = plain.find(field.key);
        if (it != plain.end()) {
            target = it->second;
        }
        if (field.required && target.empty()) {
            throw ConfigError(std::string("missing mandatory setting: ") + field.key);
        }
    };
    const auto read_bool = [&plain](const BoolFieldSpec &field, bool &target) {
        const auto it = plain.find(field.key);
        if (it != plain.end()) {
            target = to_bool(it->second, field.key);
        }
    };

    read_int(spec.interval_sec, cfg.interval_sec);
    read_int(spec.read_timeout_ms, cfg.read_timeout_ms);
    read_int(spec.history_hours, cfg.history_hours);
    read_int(spec.history_spacing_sec, cfg.history_spacing_sec);
    read_int(spec.history_max_samples, cfg.history_max_samples);
    read_int(spec.stale_after_sec, cfg.stale_after_sec);
    read_int(spec.retention_days, cfg.retention_days);
    read_int(spec.queue_capacity, cfg.queue_capacity);
    read_int(spec.drain_grace_ms, cfg.drain_grace_ms);

    read_string(spec.log_dir, cfg.log_dir);
    read_string(spec.log_basename, cfg.log_basename);
    read_bool(spec.log_fsync, cfg.log_fsync);
    read_string(spec.log_level, cfg.log_level);
    read_string(spec.pidfile, cfg.pidfile);
    read_string(spec.status_path, cfg.status_path);
    read_string(spec.gpio_chip, cfg.gpio_chip);
    read_string(spec.w1_devices_dir, cfg.w1_devices_dir);

    read_string(spec.mqtt_host, cfg.mqtt.host);
    read_int(spec.mqtt_port, cfg.mqtt.port);
    read_string(spec.mqtt_user, cfg.mqtt.user);
    read_string(spec.mqtt_password_file, cfg.mqtt.password_file);
    read_bool(spec.mqtt_tls, cfg.mqtt.tls);
    read_string(spec.mqtt_ca_cert, cfg.mqtt.ca_cert);
    read_string(spec.mqtt_base_topic, cfg.mqtt.base_topic);
    read_string(spec.mqtt_client_id, cfg.mqtt.client_id);
    read_bool(spec.mqtt_retain, cfg.mqtt.retain);
    read_int(spec.mqtt_keepalive_sec, cfg.mqtt.keepalive_sec);
    read_int(spec.mqtt_reconnect_min_sec, cfg.mqtt.reconnect_min_sec);
    read_int(spec.mqtt_reconnect_max_sec, cfg.mqtt.reconnect_max_sec);

    if (cfg.stale_after_sec == 0) {
        cfg.stale_after_sec = cfg.interval_sec * 3;
    }
    if (cfg.mqtt.reconnect_max_sec < cfg.mqtt.reconnect_min_sec) {
        cfg.mqtt.reconnect_max_sec = cfg.mqtt.reconnect_min_sec;
    }
    if (cfg.log_basename.empty() || cfg.log_basename.find('/') != std::string::npos) {
        throw ConfigError("invalid LOG_BASENAME: " + cfg.log_basename);
    }
    if (!parse_log_level(cfg.log_level)) {
        throw ConfigError("invalid LOG_LEVEL: " + cfg.log_level);
    }
    while (!cfg.mqtt.base_topic.empty() && cfg.mqtt.base_topic.back() == '/') {
        cfg.mqtt.base_topic.pop_back();
    }

    std::unordered_set<std::string> seen_source_ids;
    for (const auto &src_line : sources) {
        auto src = parse_source_line(src_line.first, src_line.second, cfg);
        if (!seen_source_ids.insert(src.id).second) {
            throw ConfigError("duplicate SOURCE id: " + src.id);
        }
        cfg.sources.push_back(std::move(src));
    }

    if (cfg.sources.empty()) {
        throw ConfigError("no SOURCE_* entries found in config");
    }

    return cfg;
}

DaemonConfig load_daemon_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config: " + path);
    }
    DaemonConfig cfg = parse_daemon_config(in);
    validate_daemon_config(cfg);
    return cfg;
}

void validate_daemon_config(const DaemonConfig &cfg) {
    std::unordered_set<std::string> ids;
    for (const auto &src : cfg.sources) {
        ids.insert(src.id);
    }

    for (const auto &src : cfg.sources) {
        if (src.type != "delta") {
            continue;
        }
        for (const std::string *input : {&src.input_a, &src.input_b}) {
            if (*input == src.id) {
                throw ConfigError("SOURCE_" + src.id + " cannot reference itself");
            }
            if (!ids.count(*input)) {
                throw ConfigError("SOURCE_" + src.id + " references unknown source: " + *input);
            }
        }
    }

    if (cfg.mqtt.host.empty()) {
        return;
    }
    if (cfg.mqtt.tls) {
        if (cfg.mqtt.ca_cert.empty()) {
            throw ConfigError("MQTT_TLS requires MQTT_CA_CERT");
        }
        std::ifstream ca(cfg.mqtt.ca_cert);
        if (!ca) {
            throw ConfigError("cannot read MQTT_CA_CERT: " + cfg.mqtt.ca_cert);
        }
    }
    if (!cfg.mqtt.password_file.empty()) {
        (void)read_secret_file(cfg.mqtt.password_file);
    }
}

std::string read_secret_file(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot read secret file: " + path);
    }
    std::string value;
    std::getline(in, value);
    value = trim(value);
    if (value.empty()) {
        throw ConfigError("secret file is empty: " + path);
    }
    return value;
}

std::string build_config_json(const DaemonConfig &cfg, const std::string &path) {
    nlohmann::json root = {
        {"ok", 1},
        {"path", path},
        {"interval", cfg.interval_sec},
        {"read_timeout_ms", cfg.read_timeout_ms},
        {"history_hours", cfg.history_hours},
        {"history_spacing", cfg.history_spacing_sec},
        {"history_max_samples", cfg.history_max_samples},
        {"stale_after", cfg.stale_after_sec},
        {"log_dir", cfg.log_dir},
        {"log_basename", cfg.log_basename},
        {"retention_days", cfg.retention_days},
        {"log_fsync", cfg.log_fsync ? 1 : 0},
        {"queue_capacity", cfg.queue_capacity},
        {"drain_grace_ms", cfg.drain_grace_ms},
        {"log_level", cfg.log_level},
        {"pidfile", cfg.pidfile},
        {"status_path", cfg.status_path},
        {"mqtt",
         {
             {"host", cfg.mqtt.host},
             {"port", cfg.mqtt.port},
             {"user", cfg.mqtt.user},
             {"password_file", cfg.mqtt.password_file},
             {"tls", cfg.mqtt.tls ? 1 : 0},
             {"ca_cert", cfg.mqtt.ca_cert},
             {"base_topic", cfg.mqtt.base_topic},
             {"client_id", cfg.mqtt.client_id},
             {"retain", cfg.mqtt.retain ? 1 : 0},
             {"keepalive", cfg.mqtt.keepalive_sec},
             {"reconnect_min", cfg.mqtt.reconnect_min_sec},
             {"reconnect_max", cfg.mqtt.reconnect_max_sec},
         }},
        {"sources", nlohmann::json::array()},
    };

    for (const auto &src : cfg.sources) {
        nlohmann::json item = {
            {"id", src.id},
            {"type", src.type},
            {"label", src.label},
            {"group", src.group},
            {"color", src.color},
            {"unit", src.unit},
            {"decimals", src.decimals},
            {"offset", src.offset},
            {"graph", src.with_graph ? 1 : 0},
            {"poll", src.poll_sec},
        };
        if (src.type == "w1") {
            item["address"] = src.address;
        } else if (src.type == "tsic") {
            item["gpio"] = src.gpio;
            item["model"] = src.tsic_model;
            item["chip"] = src.chip;
        } else if (src.type == "sysfs") {
            item["path"] = src.path;
            item["scale"] = src.scale;
        } else if (src.type == "ubus") {
            item["object"] = src.object;
            item["method"] = src.method;
            item["key"] = src.key;
            item["args"] = src.args_json;
        } else if (src.type == "simulated") {
            item["script"] = src.script;
            item["mean"] = src.mean;
            item["stddev"] = src.stddev;
            item["seed"] = src.seed;
            item["repeat"] = src.repeat;
        } else if (src.type == "delta") {
            item["a"] = src.input_a;
            item["b"] = src.input_b;
        }
        root["sources"].push_back(std::move(item));
    }

    return root.dump();
}

std::string dump_config_schema_json() {
    const ConfigSpec &spec = daemon_config_spec();

    nlohmann::json fields = nlohmann::json::array();
    const auto add_int = [&fields](const IntFieldSpec &f) {
        nlohmann::json item = {{"key", f.key}, {"type", "int"}, {"default", f.default_value},
                               {"min", f.min_value}, {"description", f.description}};
        if (f.has_max) {
            item["max"] = f.max_value;
        }
        fields.push_back(std::move(item));
    };
    const auto add_string = [&fields](const StringFieldSpec &f) {
        fields.push_back({{"key", f.key}, {"type", "string"}, {"default", f.default_value},
                          {"required", f.required ? 1 : 0}, {"description", f.description}});
    };
    const auto add_bool = [&fields](const BoolFieldSpec &f) {
        fields.push_back({{"key", f.key}, {"type", "bool"}, {"default", f.default_value ? 1 : 0},
                          {"description", f.description}});
    };

    add_int(spec.interval_sec);
    add_int(spec.read_timeout_ms);
    add_int(spec.history_hours);
    add_int(spec.history_spacing_sec);
    add_int(spec.history_max_samples);
    add_int(spec.stale_after_sec);
    add_int(spec.retention_days);
    add_int(spec.queue_capacity);
    add_int(spec.drain_grace_ms);
    add_string(spec.log_dir);
    add_string(spec.log_basename);
    add_bool(spec.log_fsync);
    add_string(spec.log_level);
    add_string(spec.pidfile);
    add_string(spec.status_path);
    add_string(spec.gpio_chip);
    add_string(spec.w1_devices_dir);
    add_string(spec.mqtt_host);
    add_int(spec.mqtt_port);
    add_string(spec.mqtt_user);
    add_string(spec.mqtt_password_file);
    add_bool(spec.mqtt_tls);
    add_string(spec.mqtt_ca_cert);
    add_string(spec.mqtt_base_topic);
    add_string(spec.mqtt_client_id);
    add_bool(spec.mqtt_retain);
    add_int(spec.mqtt_keepalive_sec);
    add_int(spec.mqtt_reconnect_min_sec);
    add_int(spec.mqtt_reconnect_max_sec);

    nlohmann::json types = nlohmann::json::array();
    for (std::size_t i = 0; i < spec.source_type_count; ++i) {
        const SourceTypeSpec &t = spec.source_types[i];
        nlohmann::json required = nlohmann::json::array();
        for (std::size_t j = 0; j < t.required_count; ++j) {
            required.push_back(t.required_fields[j]);
        }
        types.push_back({{"type", t.type}, {"required", required}, {"description", t.description}});
    }

    nlohmann::json root = {
        {"fields", fields},
        {"source_id_pattern", spec.source_id_pattern},
        {"source_types", types},
        {"source_defaults",
         {
             {"color", spec.source_default_color},
             {"unit", spec.source_default_unit},
             {"decimals", spec.source_decimals.default_value},
             {"model", spec.source_tsic_model.default_value},
         }},
    };
    return root.dump(2);
}

} // namespace heatlog::core
