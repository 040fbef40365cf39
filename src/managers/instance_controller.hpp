#pragma once

#include <memory>
#include <optional>
#include <string>
#include <cloud/control_plane.hpp>
#include <core/credentials.hpp>
#include <core/types.hpp>
#include <ssh/command_channel.hpp>

// One remote compute instance as the controller knows it.
struct InstanceHandle {
    std::string instance_id;
    std::optional<std::string> address;   // reset on every ensure_ready
    LifecycleState state = LifecycleState::Unknown;
    bool channel_verified = false;

    bool ready() const {
        return state == LifecycleState::Running && address.has_value() && channel_verified;
    }
};

// Brings one instance to a state where it can run commands, then owns the
// only channel to it. After a successful ensure_ready the controller is the
// ready instance: callers go through its delegation methods and never hold
// the channel themselves.
class InstanceController {
public:
    InstanceController(std::string instance_id, Credentials credentials,
                       ControlPlane& control_plane,
                       ChannelFactory channel_factory = SSHCommandChannel::open);
    ~InstanceController();

    InstanceController(const InstanceController&) = delete;
    InstanceController& operator=(const InstanceController&) = delete;

    // Query, start and wait if needed, resolve the address, connect, probe.
    // Failures: ResourceNotFound, StartFailed, AddressUnresolved,
    // InvalidHostKey, ConfigInvalid, ConnectFailed, InstanceNotUsable.
    // Nothing is left open on failure.
    Result<void> ensure_ready(StatusCallback callback = nullptr);

    // Release the channel. Safe to call any number of times.
    void close();

    CommandResult run_command(const std::string& cmdline);
    CommandResult run_command_captured(const std::string& cmdline);
    CommandResult run_detached(const std::string& cmdline, bool discard_output);
    Result<void> upload_bytes(const std::string& payload, const std::string& remote_path);
    Result<void> upload_file(const fs::path& local_path, const std::string& remote_path);

    const InstanceHandle& handle() const { return handle_; }

private:
    InstanceHandle handle_;
    Credentials credentials_;
    ControlPlane& control_plane_;
    ChannelFactory channel_factory_;
    std::unique_ptr<CommandChannel> channel_;

    Result<void> bring_up(StatusCallback callback);
    Result<void> connect_and_probe(StatusCallback callback);
    CommandResult not_ready(const std::string& operation) const;
};
