#pragma once

#include <string>
#include <functional>

// Failure categories surfaced by the lifecycle controller and command channel
enum class ErrorKind {
    None,
    ResourceNotFound,
    StartFailed,
    AddressUnresolved,
    InvalidHostKey,
    ConnectFailed,
    InstanceNotUsable,
    CommandTransportFailure,
    SourceInvalid,
    ConfigInvalid,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    ErrorKind kind;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, kind, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    ErrorKind kind;
    std::string error;

    static Result<void> Ok() {
        return {true, ErrorKind::None, ""};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, kind, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command outcome. error is set only when the command could not run
// (sub-session failed to open or the transport dropped).
struct CommandResult {
    int exit_status = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::string error;

    bool transport_failed() const { return !error.empty(); }
    bool success() const { return exit_status == 0 && error.empty(); }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
