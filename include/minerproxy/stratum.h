/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Stratum V1 Message Codec
 */

#ifndef MINERPROXY_STRATUM_H
#define MINERPROXY_STRATUM_H

#include "minerproxy/types.h"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace minerproxy {
namespace stratum {

using json = nlohmann::json;

/// Longest line the codec will buffer before discarding it
constexpr size_t kMaxLineLength = 16 * 1024;

// ============================================================================
// Messages
// ============================================================================

enum class MessageKind {
    REQUEST,        // method + non-null id
    NOTIFICATION,   // method + null/absent id
    RESPONSE        // result and/or error
};

enum class Method {
    SUBSCRIBE,
    AUTHORIZE,
    SUBMIT,
    NOTIFY,
    SET_DIFFICULTY,
    SET_TARGET,
    SET_EXTRANONCE,
    UNKNOWN
};

/// Error codes sent to miners in [code, message, null] triples
namespace error_code {
constexpr int UPSTREAM_UNAVAILABLE = 20;
constexpr int INVALID_AUTHORIZATION = 24;
constexpr int NOT_AUTHORIZED = 25;
}

struct Message {
    MessageKind kind = MessageKind::NOTIFICATION;
    bool has_id = false;
    json id;                        // number, string or null
    std::string method;             // empty for responses
    std::optional<json> params;
    std::optional<json> result;
    std::optional<json> error;
    json extra = json::object();    // unrecognized members, carried verbatim

    /// Method classification (aliases folded)
    Method GetMethod() const { return ClassifyMethod(method); }

    /// Response with a non-null error member
    bool HasError() const { return error.has_value() && !error->is_null(); }

    static Method ClassifyMethod(const std::string& method);
};

/// Decoded mining.subscribe result
struct SubscribeResult {
    std::string extranonce1;
    int extranonce2_size = 0;
};

/// Credentials carried by mining.authorize
struct Credentials {
    std::string address;
    std::string worker;
    std::string password;
    bool object_form = false;   // {address, worker} instead of ["address.worker", pass]
};

// ============================================================================
// Line Codec
// ============================================================================

/// Reassembles newline-delimited JSON messages from a byte stream.
/// Each line decodes independently; bad lines are logged and skipped.
class LineCodec {
public:
    explicit LineCodec(size_t max_line_length = kMaxLineLength,
                       std::string label = "Codec");

    /// Append bytes and return every complete message, in arrival order
    std::vector<Message> Feed(const std::string& data);
    std::vector<Message> Feed(const char* data, size_t len);

    /// Bytes of the current partial line
    size_t GetBufferedSize() const { return buffer_.size(); }

    /// Lines dropped for bad JSON or for exceeding the cap
    uint64_t GetDroppedLines() const { return dropped_lines_; }

    void Clear();

private:
    size_t max_line_length_;
    std::string label_;
    std::string buffer_;
    bool discarding_ = false;
    uint64_t dropped_lines_ = 0;

    void DecodeLine(const std::string& line, std::vector<Message>& out);
};

// ============================================================================
// Encoding / Decoding
// ============================================================================

/// Decode a single line (no trailing newline required)
Result<Message> ParseMessage(const std::string& line);

/// Encode as one JSON object followed by exactly one '\n'
std::string SerializeMessage(const Message& msg);

/// JSON object form, without the newline
json ToJson(const Message& msg);

/// Key used to correlate responses with requests ("1" and 1 differ)
std::string IdKey(const json& id);

// ============================================================================
// Builders
// ============================================================================

Message MakeRequest(const json& id, const std::string& method, const json& params);
Message MakeNotification(const std::string& method, const json& params);
Message MakeResult(const json& id, const json& result);
Message MakeError(const json& id, int code, const std::string& message);

// ============================================================================
// Parameter Helpers
// ============================================================================

/// Canonical "mining.*" spelling of a method
std::string MethodName(Method method);

/// result: [[subscriptions...], extranonce1, extranonce2_size]
std::optional<SubscribeResult> ParseSubscribeResult(const json& result);

/// ["address.worker", password] or {address, worker}
std::optional<Credentials> ParseAuthorizeParams(const json& params);

/// [difficulty] or {difficulty: n}
std::optional<double> ParseDifficulty(const json& params);

/// Loose truthiness (not null/false/0/"")
bool IsTruthy(const json& value);

/// Response counts as accepted: no error and a truthy result
bool IsAccepted(const Message& response);

} // namespace stratum
} // namespace minerproxy

#endif // MINERPROXY_STRATUM_H
