#include "libcore/mosquitto_session.hpp"

#include <stdexcept>
#include <utility>

#include <mosquitto.h>

namespace heatlog::core {
namespace {
constexpr auto kConnackTimeout = std::chrono::seconds(5);
} // namespace

MosquittoLibGuard::MosquittoLibGuard() {
    mosquitto_lib_init();
}

MosquittoLibGuard::~MosquittoLibGuard() {
    mosquitto_lib_cleanup();
}

MosquittoSession::MosquittoSession(const MqttConfig &cfg, std::string password) : cfg_(cfg) {
    static MosquittoLibGuard lib;

    const char *client_id = cfg_.client_id.empty() ? nullptr : cfg_.client_id.c_str();
    mosq_ = mosquitto_new(client_id, true, this);
    if (!mosq_) {
        throw std::runtime_error("mosquitto_new failed");
    }
    mosquitto_threaded_set(mosq_, true);
    mosquitto_connect_callback_set(mosq_, &MosquittoSession::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MosquittoSession::on_disconnect);

    int rc = MOSQ_ERR_SUCCESS;
    if (!cfg_.user.empty()) {
        rc = mosquitto_username_pw_set(mosq_, cfg_.user.c_str(), password.empty() ? nullptr : password.c_str());
        if (rc != MOSQ_ERR_SUCCESS) {
            mosquitto_destroy(mosq_);
            throw std::runtime_error(std::string("mqtt credentials rejected: ") + mosquitto_strerror(rc));
        }
    }
    if (cfg_.tls) {
        rc = mosquitto_tls_set(mosq_, cfg_.ca_cert.c_str(), nullptr, nullptr, nullptr, nullptr);
        if (rc != MOSQ_ERR_SUCCESS) {
            mosquitto_destroy(mosq_);
            throw std::runtime_error(std::string("mqtt tls setup failed: ") + mosquitto_strerror(rc));
        }
    }
}

MosquittoSession::~MosquittoSession() {
    if (mosq_) {
        if (connected_) {
            mosquitto_disconnect(mosq_);
        }
        mosquitto_destroy(mosq_);
    }
}

void MosquittoSession::on_connect(struct mosquitto * /* mosq */, void *obj, int rc) {
    auto *self = static_cast<MosquittoSession *>(obj);
    self->connack_seen_ = true;
    self->connack_rc_ = rc;
    self->connected_ = rc == 0;
}

void MosquittoSession::on_disconnect(struct mosquitto * /* mosq */, void *obj, int /* rc */) {
    static_cast<MosquittoSession *>(obj)->connected_ = false;
}

bool MosquittoSession::connect(std::string &error) {
    connack_seen_ = false;
    connected_ = false;

    int rc = mosquitto_connect(mosq_, cfg_.host.c_str(), cfg_.port, cfg_.keepalive_sec);
    if (rc != MOSQ_ERR_SUCCESS) {
        error = std::string("connect to ") + cfg_.host + " failed: " + mosquitto_strerror(rc);
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + kConnackTimeout;
    while (!connack_seen_) {
        if (std::chrono::steady_clock::now() >= deadline) {
            mosquitto_disconnect(mosq_);
            error = "no CONNACK from " + cfg_.host;
            return false;
        }
        rc = mosquitto_loop(mosq_, 100, 1);
        if (rc != MOSQ_ERR_SUCCESS) {
            error = std::string("handshake with ") + cfg_.host + " failed: " + mosquitto_strerror(rc);
            return false;
        }
    }

    if (!connected_) {
        error = std::string("broker refused connection: ") + mosquitto_connack_string(connack_rc_);
        mosquitto_disconnect(mosq_);
        return false;
    }
    return true;
}

bool MosquittoSession::service(std::chrono::milliseconds timeout, std::string &error) {
    const int rc = mosquitto_loop(mosq_, static_cast<int>(timeout.count()), 1);
    if (rc != MOSQ_ERR_SUCCESS) {
        error = mosquitto_strerror(rc);
        connected_ = false;
        return false;
    }
    if (!connected_) {
        error = "broker closed the connection";
        return false;
    }
    return true;
}

bool MosquittoSession::publish(const std::string &topic, const std::string &payload, bool retain, std::string &error) {
    const int rc = mosquitto_publish(mosq_,
                                     nullptr,
                                     topic.c_str(),
                                     static_cast<int>(payload.size()),
                                     payload.data(),
                                     0,
                                     retain);
    if (rc != MOSQ_ERR_SUCCESS) {
        error = mosquitto_strerror(rc);
        return false;
    }
    return true;
}

void MosquittoSession::disconnect() {
    if (connected_) {
        mosquitto_disconnect(mosq_);
    }
    connected_ = false;
}

} // namespace heatlog::core
