#pragma once

#include <chrono>
#include <string>

#include "libcore/daemon_config.hpp"
#include "libcore/publisher.hpp"

struct mosquitto;

namespace heatlog::core {

// Process-wide mosquitto_lib_init()/mosquitto_lib_cleanup() pair.
class MosquittoLibGuard {
public:
    MosquittoLibGuard();
    ~MosquittoLibGuard();

    MosquittoLibGuard(const MosquittoLibGuard &) = delete;
    MosquittoLibGuard &operator=(const MosquittoLibGuard &) = delete;
};

class MosquittoSession : public IBrokerSession {
public:
    // throws std::runtime_error when the client handle cannot be set up
    MosquittoSession(const MqttConfig &cfg, std::string password);
    ~MosquittoSession() override;

    MosquittoSession(const MosquittoSession &) = delete;
    MosquittoSession &operator=(const MosquittoSession &) = delete;

    bool connect(std::string &error) override;
    bool service(std::chrono::milliseconds timeout, std::string &error) override;
    bool publish(const std::string &topic, const std::string &payload, bool retain, std::string &error) override;
    void disconnect() override;

private:
    static void on_connect(struct mosquitto *mosq, void *obj, int rc);
    static void on_disconnect(struct mosquitto *mosq, void *obj, int rc);

    MqttConfig cfg_;
    struct mosquitto *mosq_ = nullptr;
    bool connected_ = false;
    bool connack_seen_ = false;
    int connack_rc_ = 0;
};

} // namespace heatlog::core
