/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Stratum V1 Message Codec
 */

#include "minerproxy/stratum.h"
#include "minerproxy/util.h"
#include <cstring>

namespace minerproxy {
namespace stratum {

namespace {

// Keep malformed-line log entries readable
std::string Excerpt(const std::string& line) {
    const size_t kMax = 120;
    if (line.size() <= kMax) return line;
    return line.substr(0, kMax) + "...";
}

} // namespace

// ============================================================================
// Message
// ============================================================================

Method Message::ClassifyMethod(const std::string& method) {
    std::string name = method;
    if (name.compare(0, 7, "mining.") == 0) {
        name = name.substr(7);
    }

    if (name == "subscribe") return Method::SUBSCRIBE;
    if (name == "authorize") return Method::AUTHORIZE;
    if (name == "submit") return Method::SUBMIT;
    if (name == "notify") return Method::NOTIFY;
    if (name == "set_difficulty") return Method::SET_DIFFICULTY;
    if (name == "set_target") return Method::SET_TARGET;
    if (name == "set_extranonce") return Method::SET_EXTRANONCE;
    return Method::UNKNOWN;
}

// ============================================================================
// Line Codec
// ============================================================================

LineCodec::LineCodec(size_t max_line_length, std::string label)
    : max_line_length_(max_line_length)
    , label_(std::move(label))
{}

std::vector<Message> LineCodec::Feed(const std::string& data) {
    return Feed(data.data(), data.size());
}

std::vector<Message> LineCodec::Feed(const char* data, size_t len) {
    std::vector<Message> out;
    const char* p = data;
    const char* end = data + len;

    while (p < end) {
        const char* nl = static_cast<const char*>(std::memchr(p, '\n', end - p));

        if (nl == nullptr) {
            // Partial line: keep it for the next read unless it is already too long
            if (!discarding_) {
                buffer_.append(p, end - p);
                if (buffer_.size() > max_line_length_) {
                    LogWarning(label_, "Discarding line longer than " +
                               std::to_string(max_line_length_) + " bytes");
                    buffer_.clear();
                    discarding_ = true;
                    dropped_lines_++;
                }
            }
            break;
        }

        if (discarding_) {
            // Tail of an oversized line, already counted
            discarding_ = false;
        } else {
            buffer_.append(p, nl - p);
            if (buffer_.size() > max_line_length_) {
                LogWarning(label_, "Discarding line longer than " +
                           std::to_string(max_line_length_) + " bytes");
                dropped_lines_++;
            } else {
                DecodeLine(buffer_, out);
            }
        }

        buffer_.clear();
        p = nl + 1;
    }

    return out;
}

void LineCodec::Clear() {
    buffer_.clear();
    discarding_ = false;
}

void LineCodec::DecodeLine(const std::string& line, std::vector<Message>& out) {
    std::string trimmed = Trim(line);
    if (trimmed.empty()) {
        return;
    }

    auto result = ParseMessage(trimmed);
    if (result.IsError()) {
        dropped_lines_++;
        LogWarning(label_, "Discarding malformed message: " + result.GetError() +
                   " [" + Excerpt(trimmed) + "]");
        return;
    }

    out.push_back(std::move(result.GetValue()));
}

// ============================================================================
// Encoding / Decoding
// ============================================================================

Result<Message> ParseMessage(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        return Result<Message>::Error(std::string("Invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return Result<Message>::Error("Message is not a JSON object");
    }

    Message msg;
    bool has_method = false;

    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        if (key == "id") {
            msg.has_id = true;
            msg.id = it.value();
        } else if (key == "method") {
            if (!it.value().is_string()) {
                return Result<Message>::Error("Method must be a string");
            }
            has_method = true;
            msg.method = it.value().get<std::string>();
        } else if (key == "params") {
            msg.params = it.value();
        } else if (key == "result") {
            msg.result = it.value();
        } else if (key == "error") {
            msg.error = it.value();
        } else {
            msg.extra[key] = it.value();
        }
    }

    if (msg.has_id && !(msg.id.is_number() || msg.id.is_string() || msg.id.is_null())) {
        return Result<Message>::Error("Id must be a number, string or null");
    }

    if (has_method) {
        bool has_real_id = msg.has_id && !msg.id.is_null();
        msg.kind = has_real_id ? MessageKind::REQUEST : MessageKind::NOTIFICATION;
    } else if (msg.result.has_value() || msg.error.has_value()) {
        msg.kind = MessageKind::RESPONSE;
    } else {
        return Result<Message>::Error("Message has neither method nor result/error");
    }

    return Result<Message>::Ok(std::move(msg));
}

json ToJson(const Message& msg) {
    json j = msg.extra.is_object() ? msg.extra : json::object();

    if (msg.has_id) {
        j["id"] = msg.id;
    }
    if (msg.kind != MessageKind::RESPONSE) {
        j["method"] = msg.method;
    }
    if (msg.params.has_value()) {
        j["params"] = *msg.params;
    }
    if (msg.result.has_value()) {
        j["result"] = *msg.result;
    }
    if (msg.error.has_value()) {
        j["error"] = *msg.error;
    }

    return j;
}

std::string SerializeMessage(const Message& msg) {
    return ToJson(msg).dump() + "\n";
}

std::string IdKey(const json& id) {
    return id.dump();
}

// ============================================================================
// Builders
// ============================================================================

Message MakeRequest(const json& id, const std::string& method, const json& params) {
    Message msg;
    msg.kind = MessageKind::REQUEST;
    msg.has_id = true;
    msg.id = id;
    msg.method = method;
    msg.params = params;
    return msg;
}

Message MakeNotification(const std::string& method, const json& params) {
    Message msg;
    msg.kind = MessageKind::NOTIFICATION;
    msg.has_id = true;
    msg.id = nullptr;
    msg.method = method;
    msg.params = params;
    return msg;
}

Message MakeResult(const json& id, const json& result) {
    Message msg;
    msg.kind = MessageKind::RESPONSE;
    msg.has_id = true;
    msg.id = id;
    msg.result = result;
    msg.error = nullptr;
    return msg;
}

Message MakeError(const json& id, int code, const std::string& message) {
    Message msg;
    msg.kind = MessageKind::RESPONSE;
    msg.has_id = true;
    msg.id = id;
    msg.result = nullptr;
    msg.error = json::array({code, message, nullptr});
    return msg;
}

// ============================================================================
// Parameter Helpers
// ============================================================================

std::string MethodName(Method method) {
    switch (method) {
        case Method::SUBSCRIBE: return "mining.subscribe";
        case Method::AUTHORIZE: return "mining.authorize";
        case Method::SUBMIT: return "mining.submit";
        case Method::NOTIFY: return "mining.notify";
        case Method::SET_DIFFICULTY: return "mining.set_difficulty";
        case Method::SET_TARGET: return "mining.set_target";
        case Method::SET_EXTRANONCE: return "mining.set_extranonce";
        case Method::UNKNOWN: break;
    }
    return "";
}

std::optional<SubscribeResult> ParseSubscribeResult(const json& result) {
    if (!result.is_array() || result.size() < 3) {
        return std::nullopt;
    }
    if (!result[1].is_string() || !result[2].is_number_integer()) {
        return std::nullopt;
    }

    SubscribeResult sub;
    sub.extranonce1 = result[1].get<std::string>();
    sub.extranonce2_size = result[2].get<int>();
    return sub;
}

std::optional<Credentials> ParseAuthorizeParams(const json& params) {
    Credentials creds;
    creds.worker = "default";
    creds.password = "x";

    if (params.is_array()) {
        if (params.empty() || !params[0].is_string()) {
            return std::nullopt;
        }

        // Format: address.worker or address
        std::string full = params[0].get<std::string>();
        size_t dot_pos = full.find('.');
        creds.address = full.substr(0, dot_pos);
        if (dot_pos != std::string::npos && dot_pos + 1 < full.size()) {
            creds.worker = full.substr(dot_pos + 1);
        }
        if (params.size() > 1 && params[1].is_string() && !params[1].get<std::string>().empty()) {
            creds.password = params[1].get<std::string>();
        }
    } else if (params.is_object()) {
        auto addr = params.find("address");
        if (addr == params.end() || !addr->is_string()) {
            return std::nullopt;
        }
        creds.address = addr->get<std::string>();
        auto worker = params.find("worker");
        if (worker != params.end() && worker->is_string() && !worker->get<std::string>().empty()) {
            creds.worker = worker->get<std::string>();
        }
        creds.object_form = true;
    } else {
        return std::nullopt;
    }

    if (creds.address.empty()) {
        return std::nullopt;
    }
    return creds;
}

std::optional<double> ParseDifficulty(const json& params) {
    if (params.is_array() && !params.empty() && params[0].is_number()) {
        return params[0].get<double>();
    }
    if (params.is_object()) {
        auto it = params.find("difficulty");
        if (it != params.end() && it->is_number()) {
            return it->get<double>();
        }
    }
    return std::nullopt;
}

bool IsTruthy(const json& value) {
    if (value.is_null()) return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get<std::string>().empty();
    return true;
}

bool IsAccepted(const Message& response) {
    if (response.HasError()) {
        return false;
    }
    return response.result.has_value() && IsTruthy(*response.result);
}

} // namespace stratum
} // namespace minerproxy
