#pragma once

#include <string>
#include <variant>
#include <utility>

namespace Helios {

// Broad failure classes. Callers branch on the code, humans read the message.
enum class ErrorCode {
    DeviceCall,       // a device API call returned a failure HRESULT
    OutOfMemory,      // committed resource or heap creation ran out of memory
    InvalidArgument,
    DeviceRemoved,
    Io,
    Parse,
};

[[nodiscard]] constexpr const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::DeviceCall:      return "DeviceCall";
        case ErrorCode::OutOfMemory:     return "OutOfMemory";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::DeviceRemoved:   return "DeviceRemoved";
        case ErrorCode::Io:              return "Io";
        case ErrorCode::Parse:           return "Parse";
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::DeviceCall;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    // Prefixes context while keeping the original code.
    [[nodiscard]] Error Wrap(const std::string& context) const {
        return Error(code, context + ": " + message);
    }
};

// std::expected-style result used across the renderer core
template<typename T, typename E = Error>
class Result {
private:
    // Wrapper to disambiguate when T and E are the same type
    struct ErrorWrapper {
        E error;
        explicit ErrorWrapper(E e) : error(std::move(e)) {}
    };

public:
    static Result Ok(T value) {
        return Result(std::move(value), true);
    }

    static Result Err(E error) {
        return Result(ErrorWrapper(std::move(error)), false);
    }

    template<typename... Args>
    static Result Err(ErrorCode code, Args&&... args) {
        return Err(E(code, std::forward<Args>(args)...));
    }

    [[nodiscard]] bool IsOk() const { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool IsErr() const { return std::holds_alternative<ErrorWrapper>(m_data); }

    [[nodiscard]] T& Value() & { return std::get<T>(m_data); }
    [[nodiscard]] const T& Value() const& { return std::get<T>(m_data); }
    [[nodiscard]] T&& Value() && { return std::move(std::get<T>(m_data)); }

    [[nodiscard]] E& Error() & { return std::get<ErrorWrapper>(m_data).error; }
    [[nodiscard]] const E& Error() const& { return std::get<ErrorWrapper>(m_data).error; }

    [[nodiscard]] T ValueOr(T default_value) const& {
        return IsOk() ? Value() : std::move(default_value);
    }

private:
    explicit Result(T value, bool) : m_data(std::move(value)) {}
    explicit Result(ErrorWrapper error, bool) : m_data(std::move(error)) {}

    std::variant<T, ErrorWrapper> m_data;
};

// Specialization for void success type
template<typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(true); }
    static Result Err(E error) {
        Result r(false);
        r.m_error = std::move(error);
        return r;
    }

    template<typename... Args>
    static Result Err(ErrorCode code, Args&&... args) {
        return Err(E(code, std::forward<Args>(args)...));
    }

    [[nodiscard]] bool IsOk() const { return m_ok; }
    [[nodiscard]] bool IsErr() const { return !m_ok; }

    [[nodiscard]] const E& Error() const { return m_error; }

private:
    explicit Result(bool ok) : m_ok(ok) {}

    bool m_ok;
    E m_error;
};

} // namespace Helios
