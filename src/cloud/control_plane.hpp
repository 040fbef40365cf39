#pragma once

#include <string>
#include <core/types.hpp>

// Power state of a compute instance as seen by the control plane.
enum class LifecycleState {
    Unknown,
    NotRunning,
    Starting,
    Running,
};

const char* lifecycle_state_name(LifecycleState state);

// The cloud provider's API for one kind of compute instance.
//
// Implementations surface a missing instance as ResourceNotFound from
// query_state; start/wait failures as StartFailed; a missing or unparsable
// public address as AddressUnresolved.
class ControlPlane {
public:
    virtual ~ControlPlane() = default;

    virtual Result<LifecycleState> query_state(const std::string& instance_id) = 0;
    virtual Result<void> request_start(const std::string& instance_id) = 0;

    // Blocks until the instance is running and passing status checks, using
    // the provider's own bounded polling.
    virtual Result<void> wait_until_running(const std::string& instance_id) = 0;

    // Current public address. Never cached: it changes across stop/start.
    virtual Result<std::string> resolve_address(const std::string& instance_id) = 0;
};
