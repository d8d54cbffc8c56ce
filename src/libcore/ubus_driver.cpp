#include "libcore/ubus_driver.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

extern "C" {
#include <libubox/blobmsg.h>
#include <libubus.h>
}

namespace heatlog::core {
namespace {
constexpr int kMaxArgsDepth = 16;

std::string lower_ascii(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

// Keys named like temp_mC or *_millic carry millidegrees, everything else degrees.
bool key_is_millidegrees(std::string_view key) {
    const std::string lower = lower_ascii(key);
    return lower.find("mc") != std::string::npos || lower.find("milli") != std::string::npos;
}

// "45.2 C", "45200 mC", "+45.2°C"
std::optional<double> parse_temperature_text(std::string_view text, bool millidegrees) {
    std::size_t i = 0;
    while (i < text.size() && !std::isdigit(static_cast<unsigned char>(text[i])) && text[i] != '-' &&
           text[i] != '+') {
        ++i;
    }
    if (i == text.size()) {
        return std::nullopt;
    }

    const std::string rest(text.substr(i));
    double raw = 0.0;
    std::size_t used = 0;
    try {
        raw = std::stod(rest, &used);
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (!std::isfinite(raw)) {
        return std::nullopt;
    }

    const std::string unit = lower_ascii(rest.substr(used));
    if (unit.find("mc") != std::string::npos || unit.find("milli") != std::string::npos) {
        millidegrees = true;
    } else if (unit.find('c') != std::string::npos || unit.find("deg") != std::string::npos) {
        millidegrees = false;
    }
    return millidegrees ? raw / 1000.0 : raw;
}

std::optional<double> blob_attr_to_degrees(struct blob_attr *attr, bool millidegrees) {
    if (!attr) {
        return std::nullopt;
    }

    double raw = 0.0;
    switch (blobmsg_type(attr)) {
    case BLOBMSG_TYPE_INT8:
        raw = static_cast<double>(static_cast<std::int8_t>(blobmsg_get_u8(attr)));
        break;
    case BLOBMSG_TYPE_INT16:
        raw = static_cast<double>(static_cast<std::int16_t>(blobmsg_get_u16(attr)));
        break;
    case BLOBMSG_TYPE_INT32:
        raw = static_cast<double>(static_cast<std::int32_t>(blobmsg_get_u32(attr)));
        break;
    case BLOBMSG_TYPE_INT64:
        raw = static_cast<double>(static_cast<std::int64_t>(blobmsg_get_u64(attr)));
        break;
    case BLOBMSG_TYPE_DOUBLE:
        raw = blobmsg_get_double(attr);
        break;
    case BLOBMSG_TYPE_STRING:
        return parse_temperature_text(blobmsg_get_string(attr), millidegrees);
    default:
        return std::nullopt;
    }
    return millidegrees ? raw / 1000.0 : raw;
}

class UbusContextGuard {
public:
    UbusContextGuard() : ctx_(ubus_connect(nullptr)) {}

    ~UbusContextGuard() {
        if (ctx_) {
            ubus_free(ctx_);
        }
    }

    UbusContextGuard(const UbusContextGuard &) = delete;
    UbusContextGuard &operator=(const UbusContextGuard &) = delete;

    bool valid() const {
        return ctx_ != nullptr;
    }

    struct ubus_context *get() const {
        return ctx_;
    }

private:
    struct ubus_context *ctx_ = nullptr;
};

class BlobBufGuard {
public:
    BlobBufGuard() {
        blob_buf_init(&buf_, 0);
    }

    ~BlobBufGuard() {
        blob_buf_free(&buf_);
    }

    BlobBufGuard(const BlobBufGuard &) = delete;
    BlobBufGuard &operator=(const BlobBufGuard &) = delete;

    struct blob_buf &get() {
        return buf_;
    }

private:
    struct blob_buf buf_ {};
};

bool append_json(struct blob_buf &buf, const char *name, const nlohmann::json &value, int depth, std::string &error) {
    if (depth > kMaxArgsDepth) {
        error = "ubus args nesting is too deep";
        return false;
    }

    int rc = 0;
    if (value.is_object() || value.is_array()) {
        void *cookie = value.is_object() ? blobmsg_open_table(&buf, name) : blobmsg_open_array(&buf, name);
        if (!cookie) {
            error = "cannot open ubus container field";
            return false;
        }
        bool ok = true;
        for (auto it = value.begin(); ok && it != value.end(); ++it) {
            const std::string key = value.is_object() ? it.key() : std::string();
            ok = append_json(buf, value.is_object() ? key.c_str() : nullptr, it.value(), depth + 1, error);
        }
        if (value.is_object()) {
            blobmsg_close_table(&buf, cookie);
        } else {
            blobmsg_close_array(&buf, cookie);
        }
        return ok;
    }

    if (value.is_boolean()) {
        rc = blobmsg_add_u8(&buf, name, value.get<bool>() ? 1 : 0);
    } else if (value.is_number_integer()) {
        rc = blobmsg_add_u64(&buf, name, static_cast<std::uint64_t>(value.get<std::int64_t>()));
    } else if (value.is_number_float()) {
        rc = blobmsg_add_double(&buf, name, value.get<double>());
    } else if (value.is_string()) {
        rc = blobmsg_add_string(&buf, name, value.get_ref<const std::string &>().c_str());
    } else {
        error = "unsupported value in ubus args";
        return false;
    }

    if (rc != 0) {
        error = "cannot add ubus args field";
        return false;
    }
    return true;
}

struct ReplyState {
    std::string key;
    bool has_reply = false;
    std::optional<double> degrees;
    std::string error;
};

void on_reply(struct ubus_request *req, int /* type */, struct blob_attr *msg) {
    if (!req || !req->priv) {
        return;
    }
    auto &state = *static_cast<ReplyState *>(req->priv);
    state.has_reply = true;
    if (!msg) {
        state.error = "empty ubus reply";
        return;
    }

    struct blobmsg_policy policy[2] {};
    policy[0].name = state.key.c_str();
    policy[0].type = BLOBMSG_TYPE_UNSPEC;
    policy[1].name = "error";
    policy[1].type = BLOBMSG_TYPE_STRING;

    struct blob_attr *tb[2] {};
    blobmsg_parse(policy, 2, tb, blob_data(msg), blob_len(msg));

    if (tb[0]) {
        state.degrees = blob_attr_to_degrees(tb[0], key_is_millidegrees(state.key));
        if (!state.degrees) {
            state.error = "ubus value is not a temperature: " + state.key;
        }
        return;
    }
    if (tb[1]) {
        state.error = std::string("ubus error: ") + blobmsg_get_string(tb[1]);
        return;
    }
    state.error = "ubus key not found: " + state.key;
}

} // namespace

UbusSensorDriver::UbusSensorDriver(std::string object, std::string method, std::string key, std::string args_json)
    : object_(std::move(object)), method_(std::move(method)), key_(std::move(key)), args_json_(std::move(args_json)) {
    if (args_json_.empty()) {
        args_json_ = "{}";
    }
}

DriverSample UbusSensorDriver::read(std::chrono::milliseconds timeout) {
    DriverSample s;

    UbusContextGuard ctx;
    if (!ctx.valid()) {
        s.error = "ubus connect failed";
        return s;
    }

    uint32_t object_id = 0;
    int rc = ubus_lookup_id(ctx.get(), object_.c_str(), &object_id);
    if (rc != UBUS_STATUS_OK) {
        s.error = "ubus lookup failed for " + object_ + ": " + ubus_strerror(rc);
        return s;
    }

    BlobBufGuard request;
    try {
        const nlohmann::json args = nlohmann::json::parse(args_json_);
        if (!args.is_object()) {
            s.error = "ubus args must be a JSON object";
            return s;
        }
        for (auto it = args.begin(); it != args.end(); ++it) {
            if (!append_json(request.get(), it.key().c_str(), it.value(), 0, s.error)) {
                return s;
            }
        }
    } catch (const nlohmann::json::exception &e) {
        s.error = std::string("invalid ubus args: ") + e.what();
        return s;
    }

    ReplyState state;
    state.key = key_;
    const int timeout_ms = timeout.count() < 100 ? 100 : static_cast<int>(timeout.count());
    rc = ubus_invoke(ctx.get(), object_id, method_.c_str(), request.get().head, on_reply, &state, timeout_ms);
    if (rc != UBUS_STATUS_OK) {
        s.error = "ubus call " + object_ + "." + method_ + " failed: " + ubus_strerror(rc);
        return s;
    }
    if (!state.has_reply || !state.degrees) {
        s.error = state.error.empty() ? ("ubus key not found: " + key_) : state.error;
        return s;
    }

    s.ok = true;
    s.value = *state.degrees;
    return s;
}

std::string UbusSensorDriver::describe() const {
    return "ubus " + object_ + "." + method_ + " key=" + key_;
}

} // namespace heatlog::core
