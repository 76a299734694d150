/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Common Types and Result Wrapper
 */

#ifndef MINERPROXY_TYPES_H
#define MINERPROXY_TYPES_H

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#define MINERPROXY_VERSION_MAJOR 1
#define MINERPROXY_VERSION_MINOR 0
#define MINERPROXY_VERSION_PATCH 0
#define MINERPROXY_VERSION "1.0.0"

namespace minerproxy {

using TimePoint = std::chrono::system_clock::time_point;

/// Source of "now" for components with timers; injectable for tests
using Clock = std::function<TimePoint()>;

/// Default clock (wall time)
inline TimePoint SystemNow() {
    return std::chrono::system_clock::now();
}

// ============================================================================
// Result
// ============================================================================

template <typename T>
struct Result {
    std::optional<T> value;
    std::string error;

    static Result<T> Ok(T v) {
        Result<T> r;
        r.value = std::move(v);
        return r;
    }

    static Result<T> Error(const std::string& message) {
        Result<T> r;
        r.error = message;
        return r;
    }

    bool IsOk() const { return value.has_value(); }
    bool IsError() const { return !value.has_value(); }

    const T& GetValue() const {
        if (!value) {
            throw std::logic_error("Result has no value: " + error);
        }
        return *value;
    }

    T& GetValue() {
        if (!value) {
            throw std::logic_error("Result has no value: " + error);
        }
        return *value;
    }

    const std::string& GetError() const { return error; }
};

template <>
struct Result<void> {
    bool ok = false;
    std::string error;

    static Result<void> Ok() {
        Result<void> r;
        r.ok = true;
        return r;
    }

    static Result<void> Error(const std::string& message) {
        Result<void> r;
        r.error = message;
        return r;
    }

    bool IsOk() const { return ok; }
    bool IsError() const { return !ok; }
    const std::string& GetError() const { return error; }
};

} // namespace minerproxy

#endif // MINERPROXY_TYPES_H
